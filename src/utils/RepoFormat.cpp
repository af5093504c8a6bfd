#include "utils/RepoFormat.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace {
std::string toLower(const std::string& s) {
    std::string out = s;
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

bool containsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}
} // namespace

std::string RepoFormat::formatSearchResults(const std::vector<SearchMatch>& matches) {
    if (matches.empty()) return "No matches found.";

    std::ostringstream out;
    size_t shown = std::min(matches.size(), maxShownMatches);
    for (size_t i = 0; i < shown; ++i) {
        const auto& m = matches[i];
        std::string content = m.content;
        if (content.size() > maxSnippetChars) {
            content = content.substr(0, maxSnippetChars) + "...";
        }
        char score[32];
        std::snprintf(score, sizeof(score), "%.3f", m.score);

        if (i > 0) out << "\n";
        out << "Match " << (i + 1) << " (Score: " << score << ")\n";
        out << "- File: " << (m.filePath.empty() ? "Unknown file" : m.filePath) << "\n";
        out << "- Content: " << content << "\n";
    }
    return out.str();
}

std::string RepoFormat::formatFileTree(const DirectoryListing& listing) {
    if (listing.entries.empty()) {
        return listing.rawText.empty() ? "No structure data available" : listing.rawText;
    }

    std::ostringstream out;
    size_t lines = 0;
    for (const auto& entry : listing.entries) {
        if (lines == maxTreeLines) break;
        // Indent by nesting depth of the path.
        size_t depth = 0;
        std::string name = entry;
        bool isDir = !name.empty() && name.back() == '/';
        if (isDir) name.pop_back();
        auto slash = name.find_last_of('/');
        if (slash != std::string::npos) {
            depth = static_cast<size_t>(std::count(name.begin(), name.end(), '/'));
            name = name.substr(slash + 1);
        }
        if (lines > 0) out << "\n";
        out << std::string(depth * 2, ' ') << (isDir ? "[dir] " + name + "/" : name);
        ++lines;
    }
    return out.str();
}

RepositoryInfo RepoFormat::extractRepositoryInfo(const std::string& location) {
    std::string s = trim(location);
    const std::string prefixes[] = {"https://github.com/", "http://github.com/", "git@github.com:", "github.com/"};
    for (const auto& prefix : prefixes) {
        if (s.compare(0, prefix.size(), prefix) == 0) {
            s = s.substr(prefix.size());
            break;
        }
    }
    while (!s.empty() && s.back() == '/') s.pop_back();
    if (s.size() > 4 && s.compare(s.size() - 4, 4, ".git") == 0) {
        s.erase(s.size() - 4);
    }

    RepositoryInfo info;
    auto slash = s.find('/');
    if (slash != std::string::npos) {
        info.owner = s.substr(0, slash);
        std::string rest = s.substr(slash + 1);
        auto next = rest.find('/');
        info.repo = next == std::string::npos ? rest : rest.substr(0, next);
        info.fullName = info.owner + "/" + info.repo;
    } else {
        info.fullName = s;
    }
    return info;
}

bool RepoFormat::isValidGithubRepo(const std::string& location) {
    if (location.empty()) return false;
    RepositoryInfo info = extractRepositoryInfo(location);
    return !info.owner.empty() && !info.repo.empty();
}

SearchQueryInfo RepoFormat::parseSearchQuery(const std::string& query) {
    SearchQueryInfo info;
    info.originalQuery = query;
    std::string lower = toLower(query);

    if (containsAny(lower, {"function", "method", "def ", "func"})) {
        info.intent = "function_search";
    } else if (containsAny(lower, {"class", "interface", "struct"})) {
        info.intent = "class_search";
    } else if (containsAny(lower, {"import", "require", "include"})) {
        info.intent = "import_search";
    } else if (containsAny(lower, {"config", "setting", "env"})) {
        info.intent = "config_search";
    } else if (containsAny(lower, {"test", "spec", "unittest"})) {
        info.intent = "test_search";
    }

    // Matched as whole tokens so ".c" does not fire inside ".cpp".
    const char* extensions[] = {"py", "js", "ts", "java", "cpp", "c", "go", "rs", "rb", "php"};
    std::istringstream words(lower);
    std::string word;
    std::vector<std::string> tokens;
    while (words >> word) tokens.push_back(word);
    for (const char* ext : extensions) {
        std::string dotted = std::string(".") + ext;
        for (const auto& t : tokens) {
            std::string clean = trim(t);
            while (!clean.empty() && std::ispunct(static_cast<unsigned char>(clean.back())) && clean.back() != '.') {
                clean.pop_back();
            }
            if (clean.size() >= dotted.size() &&
                clean.compare(clean.size() - dotted.size(), dotted.size(), dotted) == 0) {
                info.fileTypes.push_back(ext);
                break;
            }
        }
    }

    std::istringstream original(query);
    while (original >> word) {
        if (word.size() <= 2) continue;
        size_t start = word.find_first_not_of(".,!?;:");
        size_t end = word.find_last_not_of(".,!?;:");
        if (start == std::string::npos) continue;
        info.keywords.push_back(word.substr(start, end - start + 1));
    }
    return info;
}

std::vector<std::string> RepoFormat::parseListItems(const std::string& text, size_t maxItems) {
    std::vector<std::string> items;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line) && items.size() < maxItems) {
        line = trim(line);
        if (line.empty()) continue;
        bool bullet = line[0] == '-' || line[0] == '*';
        bool numbered = false;
        if (std::isdigit(static_cast<unsigned char>(line[0]))) {
            size_t i = 0;
            while (i < line.size() && std::isdigit(static_cast<unsigned char>(line[i]))) ++i;
            numbered = i < line.size() && (line[i] == '.' || line[i] == ')');
        }
        if (!bullet && !numbered) continue;

        size_t start = line.find_first_not_of("-*0123456789.) ");
        if (start == std::string::npos) continue;
        std::string item = trim(line.substr(start));
        // Models often wrap queries in quotes or backticks.
        while (!item.empty() && (item.front() == '"' || item.front() == '`')) item.erase(0, 1);
        while (!item.empty() && (item.back() == '"' || item.back() == '`')) item.pop_back();
        if (!item.empty()) items.push_back(item);
    }
    return items;
}
