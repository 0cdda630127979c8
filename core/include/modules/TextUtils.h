#ifndef TEXT_UTILS_H
#define TEXT_UTILS_H

#include <optional>
#include <string>
#include <vector>
#include "net/ContentService.h"

// Post-processing of generated text before it is published.

// Keeps the text after the last "##" marker, drops list/markup debris and
// the author's own @mention, collapses whitespace.
std::string cleanText(const std::string& text, const std::string& actorName);

// "#tag" / "@name" tokens in order of appearance, duplicates removed.
std::vector<std::string> extractTags(const std::string& text, char sigil);

// Emotion labels from a free-form annotation, restricted to the allowed set.
std::vector<std::string> cleanEmotions(const std::string& text,
                                       const std::vector<std::string>& allowed);

// LIKE / DISLIKE anywhere in the answer; nullopt for NONE or no match.
std::optional<Reaction> parseReaction(const std::string& text);

// First option named in the answer (case-insensitive, whole word).
std::optional<std::string> parseChoice(const std::string& text,
                                       const std::vector<std::string>& options);

#endif
