#include "modules/TextUtils.h"
#include <algorithm>
#include <cctype>

namespace {

bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string toUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

// Whole-word, already upper-cased search
bool containsWord(const std::string& haystack, const std::string& word) {
    if (word.empty()) return false;
    std::size_t pos = 0;
    while ((pos = haystack.find(word, pos)) != std::string::npos) {
        const bool startOk = pos == 0 || !isWordChar(haystack[pos - 1]);
        const std::size_t end = pos + word.size();
        const bool endOk = end >= haystack.size() || !isWordChar(haystack[end]);
        if (startOk && endOk) return true;
        pos = end;
    }
    return false;
}

}  // namespace

std::string cleanText(const std::string& text, const std::string& actorName) {
    std::string s = text;
    if (auto marker = s.rfind("##"); marker != std::string::npos) {
        s = s.substr(marker + 2);
    }

    // Self-mention
    if (!actorName.empty()) {
        const std::string self = "@" + actorName;
        for (auto pos = s.find(self); pos != std::string::npos; pos = s.find(self, pos)) {
            const std::size_t end = pos + self.size();
            if (end < s.size() && isWordChar(s[end])) {
                pos = end;  // a longer handle, not ours
                continue;
            }
            s.erase(pos, self.size());
        }
    }

    std::string out;
    out.reserve(s.size());
    bool lastSpace = true;
    for (std::size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '[' || c == ']' || c == '"') continue;
        // Dangling "@" left behind by a dropped mention
        if (c == '@' && (i + 1 >= s.size() || !isWordChar(s[i + 1]))) continue;
        if (std::isspace(static_cast<unsigned char>(c))) {
            if (!lastSpace) out.push_back(' ');
            lastSpace = true;
            continue;
        }
        out.push_back(c);
        lastSpace = false;
    }

    const std::string strip = " {}'";
    const auto first = out.find_first_not_of(strip);
    if (first == std::string::npos) return "";
    out = out.substr(first, out.find_last_not_of(strip) - first + 1);

    // Whole answer wrapped in parentheses
    if (out.size() >= 2 && out.front() == '(' && out.back() == ')') {
        out = out.substr(1, out.size() - 2);
    }
    return out;
}

std::vector<std::string> extractTags(const std::string& text, char sigil) {
    std::vector<std::string> tags;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] != sigil) continue;
        std::size_t j = i + 1;
        while (j < text.size() && isWordChar(text[j])) ++j;
        if (j == i + 1) continue;
        std::string tag = text.substr(i, j - i);
        if (std::find(tags.begin(), tags.end(), tag) == tags.end()) tags.push_back(std::move(tag));
        i = j - 1;
    }
    return tags;
}

std::vector<std::string> cleanEmotions(const std::string& text,
                                       const std::vector<std::string>& allowed) {
    std::vector<std::string> found;
    std::string token;
    auto flush = [&]() {
        if (token.empty()) return;
        std::string lower = token;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (std::find(allowed.begin(), allowed.end(), lower) != allowed.end() &&
            std::find(found.begin(), found.end(), lower) == found.end()) {
            found.push_back(lower);
        }
        token.clear();
    };
    for (char c : text) {
        if (std::isalpha(static_cast<unsigned char>(c))) {
            token.push_back(c);
        } else if (c != '*') {
            flush();
        }
    }
    flush();
    return found;
}

std::optional<Reaction> parseReaction(const std::string& text) {
    const std::string upper = toUpper(text);
    if (containsWord(upper, "DISLIKE")) return Reaction::Dislike;
    if (containsWord(upper, "LIKE")) return Reaction::Like;
    return std::nullopt;
}

std::optional<std::string> parseChoice(const std::string& text,
                                       const std::vector<std::string>& options) {
    const std::string upper = toUpper(text);
    for (const auto& option : options) {
        if (containsWord(upper, toUpper(option))) return option;
    }
    return std::nullopt;
}
