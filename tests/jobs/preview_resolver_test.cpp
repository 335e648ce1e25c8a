#include "fetchd/jobs/preview.hpp"
#include "support/fake_fetch_service.hpp"

#include <gtest/gtest.h>

using fetchd::Error;
using fetchd::ErrorKind;
using fetchd::fetch::ResolveMode;
using fetchd::jobs::PreviewResolver;
using fetchd::test_support::FakeFetchService;
using fetchd::test_support::collection;
using fetchd::test_support::single;

TEST(PreviewResolverTest, SingleItemHasTotalOne) {
    FakeFetchService fetcher;
    fetcher.set_metadata("https://example.test/v", single("Clip", 95.0));
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview("https://example.test/v");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().total, 1u);
    EXPECT_EQ(result.value().title, "Clip");
    ASSERT_EQ(result.value().manifest.size(), 1u);
    EXPECT_EQ(result.value().manifest[0].duration_seconds, 95.0);
    EXPECT_EQ(fetcher.resolve_calls(ResolveMode::FlatListing), 1u);
    EXPECT_EQ(fetcher.resolve_calls(ResolveMode::Full), 0u);
}

TEST(PreviewResolverTest, UnresolvableEntriesAreSkippedAndNotCounted) {
    FakeFetchService fetcher;
    fetcher.set_metadata("https://example.test/list", collection("Mix", {"A", "", "C", ""}));
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview("https://example.test/list");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().total, 2u);
    ASSERT_EQ(result.value().manifest.size(), 2u);
    EXPECT_EQ(result.value().manifest[0].label, "A");
    EXPECT_EQ(result.value().manifest[1].label, "C");
}

TEST(PreviewResolverTest, EmptySourceIsAnInputError) {
    FakeFetchService fetcher;
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview("");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Input);
    EXPECT_EQ(fetcher.resolve_calls(ResolveMode::FlatListing), 0u);
}

TEST(PreviewResolverTest, WhitespaceSourceIsAnInputError) {
    FakeFetchService fetcher;
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview(" \t\n ");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Input);
    EXPECT_EQ(fetcher.resolve_calls(ResolveMode::FlatListing), 0u);
}

TEST(PreviewResolverTest, NothingFoundIsAResolutionError) {
    FakeFetchService fetcher;
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview("https://example.test/missing");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Resolution);
}

TEST(PreviewResolverTest, CollaboratorFailureIsAResolutionError) {
    FakeFetchService fetcher;
    fetcher.fail_resolve("https://example.test/private", Error::transfer("Private video"));
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview("https://example.test/private");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Resolution);
    EXPECT_NE(result.error().message.find("Private video"), std::string::npos);
}

TEST(PreviewResolverTest, CollectionWithNoResolvableEntriesIsRejected) {
    FakeFetchService fetcher;
    fetcher.set_metadata("https://example.test/dead", collection("Dead", {"", ""}));
    PreviewResolver resolver(fetcher);

    auto result = resolver.preview("https://example.test/dead");

    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::Resolution);
}
