#include "pch.h"
#include "../../src/Logic/RenamerEngine.h"
#include <set>
#include <string>

TEST(RenamerEngineCollision, FreeNameUnchanged)
{
    std::set<std::string> entries = {"a.pdf", "b.pdf"};
    CollisionResult r = RenamerEngine::ResolveCollision(entries, "Intro.pdf", DuplicatePolicy::Number);
    ASSERT_EQ(r.status, CollisionStatus::Resolved);
    EXPECT_EQ(r.name, "Intro.pdf");

    CollisionResult skip = RenamerEngine::ResolveCollision(entries, "Intro.pdf", DuplicatePolicy::Skip);
    ASSERT_EQ(skip.status, CollisionStatus::Resolved);
    EXPECT_EQ(skip.name, "Intro.pdf");
}

TEST(RenamerEngineCollision, NumberPolicyCountsUpInOrder)
{
    std::set<std::string> entries = {"Intro.pdf"};
    CollisionResult first = RenamerEngine::ResolveCollision(entries, "Intro.pdf", DuplicatePolicy::Number);
    ASSERT_EQ(first.status, CollisionStatus::Resolved);
    EXPECT_EQ(first.name, "Intro (1).pdf");

    entries.insert(first.name);
    CollisionResult second = RenamerEngine::ResolveCollision(entries, "Intro.pdf", DuplicatePolicy::Number);
    ASSERT_EQ(second.status, CollisionStatus::Resolved);
    EXPECT_EQ(second.name, "Intro (2).pdf");
}

TEST(RenamerEngineCollision, NumberPolicyFillsFirstGap)
{
    std::set<std::string> entries = {"Intro.pdf", "Intro (1).pdf", "Intro (3).pdf"};
    CollisionResult r = RenamerEngine::ResolveCollision(entries, "Intro.pdf", DuplicatePolicy::Number);
    ASSERT_EQ(r.status, CollisionStatus::Resolved);
    EXPECT_EQ(r.name, "Intro (2).pdf");
}

TEST(RenamerEngineCollision, SkipPolicyConflicts)
{
    std::set<std::string> entries = {"Intro.pdf"};
    CollisionResult r = RenamerEngine::ResolveCollision(entries, "Intro.pdf", DuplicatePolicy::Skip);
    EXPECT_EQ(r.status, CollisionStatus::Conflict);
    EXPECT_TRUE(r.name.empty());
}

TEST(RenamerEngineCollision, NameWithoutExtension)
{
    std::set<std::string> entries = {"README"};
    CollisionResult r = RenamerEngine::ResolveCollision(entries, "README", DuplicatePolicy::Number);
    ASSERT_EQ(r.status, CollisionStatus::Resolved);
    EXPECT_EQ(r.name, "README (1)");
}

TEST(RenamerEngineCollision, NumberedNameStaysWithinBasenameLimit)
{
    const std::string longName = std::string(251, 'a') + ".pdf";
    std::set<std::string> entries = {longName};
    CollisionResult r = RenamerEngine::ResolveCollision(entries, longName, DuplicatePolicy::Number);
    ASSERT_EQ(r.status, CollisionStatus::Resolved);
    EXPECT_EQ(r.name, std::string(247, 'a') + " (1).pdf");
    EXPECT_EQ(r.name.size(), 255u);
}

TEST(RenamerEngineCollision, ShortenedStemIsTrimmed)
{
    // Cutting at 247 bytes lands right after the space
    const std::string longName = std::string(246, 'a') + " bbbb.pdf";
    ASSERT_EQ(longName.size(), 255u);
    std::set<std::string> entries = {longName};
    CollisionResult r = RenamerEngine::ResolveCollision(entries, longName, DuplicatePolicy::Number);
    ASSERT_EQ(r.status, CollisionStatus::Resolved);
    EXPECT_EQ(r.name, std::string(246, 'a') + " (1).pdf");
}

TEST(RenamerEngineCollision, ExhaustedSuffixesConflict)
{
    std::set<std::string> entries = {"x.pdf"};
    for (int i = 1; i <= RenamerEngine::MaxDuplicateSuffix; ++i)
    {
        entries.insert("x (" + std::to_string(i) + ").pdf");
    }
    CollisionResult r = RenamerEngine::ResolveCollision(entries, "x.pdf", DuplicatePolicy::Number);
    EXPECT_EQ(r.status, CollisionStatus::Conflict);
}
