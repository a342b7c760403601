#include "delo/ambient/utils/TextMatch.h"

#include <algorithm>
#include <cctype>
#include <set>

namespace delo::ambient::utils {

std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string normalizeCommand(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            pendingSpace = !out.empty();
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return true;
    return toLowerCopy(haystack).find(toLowerCopy(needle)) != std::string::npos;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

std::vector<std::string> splitWords(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (unsigned char c : s) {
        if (std::isspace(c)) {
            if (!cur.empty()) out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(static_cast<char>(c));
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static bool isWordChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

size_t findPhrase(const std::string& text, const std::string& phrase) {
    if (phrase.empty()) return std::string::npos;
    size_t pos = text.find(phrase);
    while (pos != std::string::npos) {
        const bool leftOk = pos == 0 || !isWordChar(text[pos - 1]);
        const size_t end = pos + phrase.size();
        const bool rightOk = end >= text.size() || !isWordChar(text[end]);
        if (leftOk && rightOk) return pos;
        pos = text.find(phrase, pos + 1);
    }
    return std::string::npos;
}

size_t editDistance(const std::string& a, const std::string& b) {
    const size_t n = a.size();
    const size_t m = b.size();
    std::vector<std::vector<size_t>> d(n + 1, std::vector<size_t>(m + 1, 0));
    for (size_t i = 0; i <= n; ++i) d[i][0] = i;
    for (size_t j = 0; j <= m; ++j) d[0][j] = j;
    for (size_t i = 1; i <= n; ++i) {
        for (size_t j = 1; j <= m; ++j) {
            const size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
            d[i][j] = std::min({d[i - 1][j] + 1, d[i][j - 1] + 1, d[i - 1][j - 1] + cost});
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                d[i][j] = std::min(d[i][j], d[i - 2][j - 2] + 1);
            }
        }
    }
    return d[n][m];
}

double similarity(const std::string& a, const std::string& b) {
    const size_t maxLen = std::max(a.size(), b.size());
    if (maxLen == 0) return 1.0;
    return 1.0 - static_cast<double>(editDistance(a, b)) / static_cast<double>(maxLen);
}

uint32_t contentHash(const std::string& text) {
    uint32_t h = 0;
    for (unsigned char c : text) {
        h = h * 31u + c;
    }
    return h;
}

double jaccardSimilarity(const std::string& a, const std::string& b) {
    const auto wa = splitWords(toLowerCopy(a));
    const auto wb = splitWords(toLowerCopy(b));
    const std::set<std::string> sa(wa.begin(), wa.end());
    const std::set<std::string> sb(wb.begin(), wb.end());
    if (sa.empty() && sb.empty()) return 1.0;
    size_t inter = 0;
    for (const auto& w : sa) {
        if (sb.count(w)) inter++;
    }
    const size_t uni = sa.size() + sb.size() - inter;
    return static_cast<double>(inter) / static_cast<double>(uni);
}

std::string urlEncode(const std::string& s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

} // namespace delo::ambient::utils
