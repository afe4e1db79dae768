#include "hotpush/manifest_diff.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

namespace hotpush {
namespace {

ContentManifest MakeManifest(std::vector<ManifestFile> files) {
    ContentManifest m;
    m.files = std::move(files);
    return m;
}

std::vector<std::string> Paths(const std::vector<ManifestFile>& files) {
    std::vector<std::string> out;
    for (const auto& f : files)
        out.push_back(f.path);
    return out;
}

TEST(ManifestDiffTest, AddedFileOnlyAppearsInAdded) {
    const auto old_m = MakeManifest({{"a.js", "h1"}});
    const auto new_m = MakeManifest({{"a.js", "h1"}, {"b.js", "h2"}});

    const auto diff = ManifestDiffEngine::Diff(old_m, new_m);
    EXPECT_FALSE(diff.IsEmpty());
    EXPECT_EQ(Paths(diff.added), std::vector<std::string>{"b.js"});
    EXPECT_TRUE(diff.updated.empty());
    EXPECT_TRUE(diff.removed.empty());
    EXPECT_EQ(Paths(diff.UpdateFiles()), std::vector<std::string>{"b.js"});
}

TEST(ManifestDiffTest, ChangedFingerprintOnlyAppearsInUpdated) {
    const auto old_m = MakeManifest({{"index.html", "f1"}, {"app.css", "c1"}});
    const auto new_m = MakeManifest({{"index.html", "f2"}, {"app.css", "c1"}});

    const auto diff = ManifestDiffEngine::Diff(old_m, new_m);
    EXPECT_TRUE(diff.added.empty());
    ASSERT_EQ(diff.updated.size(), 1u);
    EXPECT_EQ(diff.updated[0].path, "index.html");
    EXPECT_EQ(diff.updated[0].fingerprint, "f2");
    EXPECT_TRUE(diff.removed.empty());
}

TEST(ManifestDiffTest, DroppedFileOnlyAppearsInRemoved) {
    const auto old_m = MakeManifest({{"a.js", "h1"}, {"old.js", "h9"}});
    const auto new_m = MakeManifest({{"a.js", "h1"}});

    const auto diff = ManifestDiffEngine::Diff(old_m, new_m);
    EXPECT_TRUE(diff.added.empty());
    EXPECT_TRUE(diff.updated.empty());
    EXPECT_EQ(Paths(diff.removed), std::vector<std::string>{"old.js"});
    EXPECT_TRUE(diff.UpdateFiles().empty());
}

TEST(ManifestDiffTest, SameManifestObjectIsEmptyDiff) {
    const auto m = MakeManifest({{"a.js", "h1"}, {"img/logo.png", "h2"}});
    EXPECT_TRUE(ManifestDiffEngine::Diff(m, m).IsEmpty());

    const auto empty = MakeManifest({});
    EXPECT_TRUE(ManifestDiffEngine::Diff(empty, empty).IsEmpty());
}

TEST(ManifestDiffTest, OrderDoesNotMatterOnlyPathAndFingerprint) {
    const auto old_m = MakeManifest({{"a.js", "h1"}, {"b.js", "h2"}});
    const auto new_m = MakeManifest({{"b.js", "h2"}, {"a.js", "h1"}});
    EXPECT_TRUE(ManifestDiffEngine::Diff(old_m, new_m).IsEmpty());
}

TEST(ManifestDiffTest, MixedChangesAreDisjoint) {
    const auto old_m = MakeManifest({{"keep", "k"}, {"change", "c1"}, {"drop", "d"}});
    const auto new_m = MakeManifest({{"change", "c2"}, {"new", "n"}, {"keep", "k"}});

    const auto diff = ManifestDiffEngine::Diff(old_m, new_m);
    EXPECT_EQ(Paths(diff.added), std::vector<std::string>{"new"});
    EXPECT_EQ(Paths(diff.updated), std::vector<std::string>{"change"});
    EXPECT_EQ(Paths(diff.removed), std::vector<std::string>{"drop"});
    EXPECT_EQ(Paths(diff.UpdateFiles()), (std::vector<std::string>{"new", "change"}));
}

TEST(ManifestDiffTest, FromEmptyInstalledManifestEverythingIsAdded) {
    const auto old_m = MakeManifest({});
    const auto new_m = MakeManifest({{"a", "1"}, {"b", "2"}});

    const auto diff = ManifestDiffEngine::Diff(old_m, new_m);
    EXPECT_EQ(Paths(diff.added), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(diff.updated.empty());
    EXPECT_TRUE(diff.removed.empty());
}

} // namespace
} // namespace hotpush
