#pragma once
#include <string>
#include <vector>
#include "core/AnswerGenerator.h"
#include "mcp/RepositoryClient.h"

struct ChatMessage {
    std::string role;     // "user", "assistant" or "tool"
    std::string name;     // tool messages: the operation that produced them
    std::string content;
};

/**
 * @brief One conversation about the active repository.
 *
 * Routes each prompt to a structure listing, a semantic search or a plain
 * answer. Repository failures never end the turn: the generator answers
 * without repository context and the failure is kept in the history.
 */
class ChatSession {
public:
    enum class Route { Structure, Search, General };

    /** repository may be null; every prompt is then answered without repository context. */
    ChatSession(IAnswerGenerator& generator, RepositoryClient* repository, int maxResults = 10);

    std::string handleUserInput(const std::string& prompt);

    Outcome<IndexResult> indexRepository();

    std::vector<std::string> suggestQueries(const std::string& repositoryInfo);

    /** Asks the generator to explain a set of matches for a query. */
    std::string analyzeResults(const std::string& query, const std::vector<SearchMatch>& matches);

    void setRepository(const std::string& location) { activeRepository = location; }
    const std::string& getRepository() const { return activeRepository; }

    const std::vector<ChatMessage>& getHistory() const { return history; }
    void clear() { history.clear(); }

    static Route classify(const std::string& prompt);

private:
    IAnswerGenerator& generator;
    RepositoryClient* repository;
    int maxResults;
    std::string activeRepository;
    std::vector<ChatMessage> history;

    std::string handleStructure(const std::string& prompt);
    std::string handleSearch(const std::string& prompt);
    std::string answer(const std::string& prompt, const std::string& context);
    std::string reply(const std::string& content);
    void note(const std::string& name, const std::string& content);
};
