#pragma once

#include <string>
#include <vector>

// Split text into pieces of at most max_bytes bytes for a chat message limit.
// A piece ends at the last newline in the budget when that newline lies past
// half of it; otherwise at the budget, moved back so no UTF-8 sequence is
// cut. The newline starts the next piece, so joining the pieces gives back
// the input exactly. Text within the budget comes back as one piece.
std::vector<std::string> chunk_text(const std::string& text, size_t max_bytes);
