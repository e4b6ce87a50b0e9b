#pragma once

#include <string>
#include <optional>

// Turn the last exchange on an idle screen into a chat message.
//
// The answer runs from the newest user echo ("> question") to the first
// empty prompt after it. Tool calls become short labels, tool results are
// inlined when small, narrative text is kept as is, and terminal chrome is
// dropped. Returns nullopt when nothing new would be said: no user echo,
// empty result, or a result equal to previous_emission.
std::optional<std::string> extract_response(const std::string& snapshot,
                                            const std::string& previous_emission);
