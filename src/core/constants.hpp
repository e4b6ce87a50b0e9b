#pragma once

// ── Agent screen markers ────────────────────────────────────
// Glyphs the agent CLI draws in its transcript.
constexpr const char* ACTION_MARKER  = "\xe2\x8f\xba";   // ⏺  tool call or narrative
constexpr const char* RESULT_MARKER  = "\xe2\x8e\xbf";   // ⎿  tool result
constexpr const char* RULE_CHAR      = "\xe2\x94\x80";   // ─  separator rule
constexpr const char* BOX_VERTICAL   = "\xe2\x94\x82";   // │  input box border

// ── Screen scanning windows ─────────────────────────────────
constexpr int BUSY_WINDOW_LINES      = 30;    // Trailing lines checked for work indicators
constexpr int DECISION_WINDOW_LINES  = 30;    // Trailing lines checked for permission prompts
constexpr int IDLE_WINDOW_LINES      = 15;    // Non-decorative lines searched for an empty prompt
constexpr int DECISION_EXCERPT_LINES = 12;    // Lines quoted in a permission notice

// ── Response formatting ─────────────────────────────────────
constexpr int SHELL_INLINE_MAX_CHARS  = 200;  // Shorter shell output is fenced inline
constexpr int RESULT_POINTER_MAX_CHARS = 100; // Shorter tool results get a ↳ line

// ── Worker pool ─────────────────────────────────────────────
constexpr int WORK_QUEUE_CAPACITY     = 64;

// ── Loop granularity ────────────────────────────────────────
constexpr int SHUTDOWN_CHECK_MS       = 100;  // Sleep slice for responsive shutdown
constexpr int REPL_EVENT_POLL_US      = 100000;  // readline idle hook period
