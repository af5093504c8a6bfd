#include <gtest/gtest.h>
#include "mcp/ToolRouting.h"

TEST(ToolRoutingTest, RepositoryLocalName) {
    EXPECT_EQ(ToolRouting::repositoryLocalName("https://github.com/octocat/Hello-World.git"), "Hello-World");
    EXPECT_EQ(ToolRouting::repositoryLocalName("octocat/Hello-World"), "Hello-World");
    EXPECT_EQ(ToolRouting::repositoryLocalName("octocat/Hello-World/"), "Hello-World");
    EXPECT_EQ(ToolRouting::repositoryLocalName("git@github.com:octocat/Hello-World.git"), "Hello-World");
    EXPECT_EQ(ToolRouting::repositoryLocalName("Hello-World"), "Hello-World");
}

TEST(ToolRoutingTest, CandidateListsPreferCurrentNames) {
    EXPECT_EQ(ToolRouting::candidates(LogicalOperation::IndexRepository).front(), "create_research_repository");
    EXPECT_EQ(ToolRouting::candidates(LogicalOperation::SearchRepository).front(), "search_research_repository");
    EXPECT_EQ(ToolRouting::candidates(LogicalOperation::FetchFile).front(), "access_file");
    EXPECT_EQ(ToolRouting::candidates(LogicalOperation::ListStructure).front(), "access_file");
    EXPECT_EQ(ToolRouting::candidates(LogicalOperation::SearchCode).front(), "search_code");
    EXPECT_EQ(ToolRouting::candidates(LogicalOperation::SearchRepository).size(), 10u);
}

TEST(ToolRoutingTest, ResearchIndexTakesRepositoryPath) {
    OperationParams p;
    p.repository = "octocat/Hello-World";
    auto args = ToolRouting::buildArguments(LogicalOperation::IndexRepository, "create_research_repository", p);
    EXPECT_EQ(args, nlohmann::json({{"repository_path", "octocat/Hello-World"}}));
    EXPECT_TRUE(ToolRouting::hasSpecialBuilder(LogicalOperation::IndexRepository, "create_research_repository"));
}

TEST(ToolRoutingTest, ResearchSearchUsesIndexLocation) {
    OperationParams p;
    p.repository = "https://github.com/octocat/Hello-World";
    p.query = "greeting";
    p.limit = 4;

    auto args = ToolRouting::buildArguments(LogicalOperation::SearchRepository, "search_research_repository", p);
    EXPECT_EQ(args["index_path"], "Hello-World");
    EXPECT_EQ(args["query"], "greeting");
    EXPECT_EQ(args["limit"], 4);

    p.indexLocation = "/var/indexes/Hello-World";
    args = ToolRouting::buildArguments(LogicalOperation::SearchRepository, "search_research_repository", p);
    EXPECT_EQ(args["index_path"], "/var/indexes/Hello-World");
}

TEST(ToolRoutingTest, AccessFilePathsAreRelativeToTheClone) {
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.filePath = "/src/main.c";

    auto fetch = ToolRouting::buildArguments(LogicalOperation::FetchFile, "access_file", p);
    EXPECT_EQ(fetch, nlohmann::json({{"filepath", "Hello-World/repository/src/main.c"}}));

    auto tree = ToolRouting::buildArguments(LogicalOperation::ListStructure, "access_file", p);
    EXPECT_EQ(tree, nlohmann::json({{"filepath", "Hello-World/repository"}}));
}

TEST(ToolRoutingTest, DefaultBuildersCoverLegacyNames) {
    OperationParams p;
    p.repository = "octocat/Hello-World";
    p.query = "q";
    p.limit = 7;
    p.filePath = "README";
    p.pattern = "main";

    auto search = ToolRouting::buildArguments(LogicalOperation::SearchRepository, "semantic_search", p);
    EXPECT_EQ(search, nlohmann::json({{"repository", "octocat/Hello-World"}, {"query", "q"}, {"max_results", 7}}));
    EXPECT_FALSE(ToolRouting::hasSpecialBuilder(LogicalOperation::SearchRepository, "semantic_search"));

    auto fetch = ToolRouting::buildArguments(LogicalOperation::FetchFile, "get_file_content", p);
    EXPECT_EQ(fetch, nlohmann::json({{"repository", "octocat/Hello-World"}, {"file_path", "README"}}));

    auto index = ToolRouting::buildArguments(LogicalOperation::IndexRepository, "index_repository", p);
    EXPECT_EQ(index, nlohmann::json({{"repository", "octocat/Hello-World"}}));

    auto code = ToolRouting::buildArguments(LogicalOperation::SearchCode, "grep", p);
    EXPECT_FALSE(code.contains("file_type"));
    p.fileType = "c";
    code = ToolRouting::buildArguments(LogicalOperation::SearchCode, "grep", p);
    EXPECT_EQ(code["file_type"], "c");
    EXPECT_EQ(code["pattern"], "main");
}
