#include <campaign-sync/error.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace campaign_sync;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::storage_write_failure), "storage_write_failure");
    EXPECT_EQ(to_string_view(ErrorKind::not_found),             "not_found");
    EXPECT_EQ(to_string_view(ErrorKind::queue_flush_rejected),  "queue_flush_rejected");
    EXPECT_EQ(to_string_view(ErrorKind::transport_unavailable), "transport_unavailable");
    EXPECT_EQ(to_string_view(ErrorKind::snapshot_corrupt),      "snapshot_corrupt");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_config),        "invalid_config");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::not_found, "no campaigns"};
    const auto e2 = Error{ErrorKind::not_found, "no campaigns"};
    const auto e3 = Error{ErrorKind::snapshot_corrupt, "no campaigns"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::not_found, "foo"};
    const auto e2 = Error{ErrorKind::not_found, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(Failure, carries_error_and_formats_what) {
    const auto f = Failure{ErrorKind::queue_flush_rejected, "stale base"};

    EXPECT_EQ(f.kind(), ErrorKind::queue_flush_rejected);
    EXPECT_EQ(f.error().message, "stale base");
    EXPECT_EQ(std::string{f.what()}, "queue_flush_rejected: stale base");
}

TEST(Failure, catchable_as_runtime_error) {
    try {
        throw Failure{ErrorKind::storage_write_failure, "quota exceeded"};
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("quota exceeded"), std::string::npos);
        return;
    }
    FAIL() << "Failure was not caught as std::runtime_error";
}
