#include "core/ChatSession.h"
#include "utils/RepoFormat.h"
#include "utils/Logger.h"
#include <algorithm>
#include <cctype>
#include <stdexcept>

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

std::string describeFailure(const std::string& message, const std::string& hint) {
    return hint.empty() ? message : message + " (" + hint + ")";
}
} // namespace

ChatSession::ChatSession(IAnswerGenerator& generator, RepositoryClient* repository, int maxResults)
    : generator(generator), repository(repository), maxResults(maxResults > 0 ? maxResults : 10) {}

ChatSession::Route ChatSession::classify(const std::string& prompt) {
    std::string lower = toLower(prompt);
    if (containsAny(lower, {"structure", "folder", "directory", "tree", "layout"})) return Route::Structure;
    if (containsAny(lower, {"search", "find", "look for", "code", "function", "class"})) return Route::Search;
    return Route::General;
}

std::string ChatSession::handleUserInput(const std::string& prompt) {
    history.push_back({"user", "", prompt});

    Route route = classify(prompt);
    if (route == Route::General) {
        return reply(answer(prompt, ""));
    }

    if (activeRepository.empty()) {
        return reply("Please specify a GitHub repository first (for example /repo owner/name).");
    }
    if (!repository) {
        note("tool server", "Tool server is not configured; answering without repository context.");
        return reply(answer(prompt, ""));
    }

    return route == Route::Structure ? handleStructure(prompt) : handleSearch(prompt);
}

std::string ChatSession::handleStructure(const std::string& prompt) {
    auto outcome = repository->listStructure(activeRepository);
    if (!outcome.ok()) {
        note("list structure", "Structure listing failed: " + describeFailure(outcome.message, outcome.hint));
        return reply(answer(prompt, ""));
    }

    std::string tree = RepoFormat::formatFileTree(outcome.value);
    note("list structure", tree);

    std::string explainPrompt =
        "Analyze this repository structure and provide an overview:\n\n"
        "1. What type of project this appears to be\n"
        "2. Key directories and their purposes\n"
        "3. Main technologies or frameworks used\n"
        "4. Architecture patterns observed\n"
        "5. Entry points and important files\n\n"
        "Repository Structure:\n" + tree + "\n\nUser question: " + prompt;
    return reply(answer(explainPrompt, ""));
}

std::string ChatSession::handleSearch(const std::string& prompt) {
    auto outcome = repository->search(activeRepository, prompt, maxResults);
    if (outcome.empty()) {
        note("search", "No matches found.");
        return reply(answer(prompt, "Repository: " + activeRepository + "\nSearch Results: no matches found."));
    }
    if (!outcome.ok()) {
        note("search", "Search failed: " + describeFailure(outcome.message, outcome.hint));
        return reply(answer(prompt, ""));
    }

    std::string formatted = RepoFormat::formatSearchResults(outcome.value);
    note("search", formatted);
    std::string context = "Repository: " + activeRepository + "\nSearch Results:\n" + formatted;
    return reply(answer(prompt, context));
}

std::string ChatSession::answer(const std::string& prompt, const std::string& context) {
    try {
        return generator.generate(prompt, context);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Answer generation failed: ") + e.what());
        return std::string("Failed to generate response: ") + e.what();
    }
}

std::string ChatSession::reply(const std::string& content) {
    history.push_back({"assistant", "", content});
    return content;
}

void ChatSession::note(const std::string& name, const std::string& content) {
    history.push_back({"tool", name, content});
}

Outcome<IndexResult> ChatSession::indexRepository() {
    if (activeRepository.empty()) {
        return Outcome<IndexResult>::failure(ErrorKind::InvalidArgument, "No active repository");
    }
    if (!repository) {
        return Outcome<IndexResult>::failure(ErrorKind::SpawnFailed, "Tool server is not configured");
    }
    auto outcome = repository->indexRepository(activeRepository);
    if (outcome.ok()) {
        note("index repository", "Indexed " + activeRepository + " at " + outcome.value.indexLocation);
    } else {
        note("index repository", "Indexing failed: " + describeFailure(outcome.message, outcome.hint));
    }
    return outcome;
}

std::vector<std::string> ChatSession::suggestQueries(const std::string& repositoryInfo) {
    std::string prompt =
        "Based on this repository information, suggest 5-7 useful search queries that would help a developer "
        "understand the codebase:\n\n"
        "Repository Info:\n" + repositoryInfo + "\n\n"
        "Provide queries that would reveal:\n"
        "- Main functionality\n"
        "- API endpoints or interfaces\n"
        "- Configuration patterns\n"
        "- Error handling\n"
        "- Testing approaches\n"
        "- Key algorithms or business logic\n\n"
        "Return as a simple list.";
    try {
        return RepoFormat::parseListItems(generator.generate(prompt, ""), 7);
    } catch (const std::exception& e) {
        Logger::getInstance().warn(std::string("Query suggestions unavailable: ") + e.what());
        return {};
    }
}

std::string ChatSession::analyzeResults(const std::string& query, const std::vector<SearchMatch>& matches) {
    std::string prompt =
        "Analyze the following code search results and provide insights:\n\n"
        "1. Summarize what was found\n"
        "2. Explain the relevant code patterns or structures\n"
        "3. Suggest how this code might be used or modified\n"
        "4. Point out any interesting implementation details\n"
        "5. Recommend next steps for exploration\n\n"
        "Search Query: " + query + "\nSearch Results:\n" + RepoFormat::formatSearchResults(matches);
    return answer(prompt, "");
}
