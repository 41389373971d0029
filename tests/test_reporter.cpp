#include <gtest/gtest.h>
#include "reporter.hpp"
#include <sstream>

using namespace epm;

class ReporterTest : public ::testing::Test {
protected:
    ReporterTest() : reporter(output) {}

    std::ostringstream output;
    Reporter reporter;
};

TEST_F(ReporterTest, FormatLine) {
    EXPECT_EQ(Reporter::format_line({"fetch.com", 67}), "fetch.com has 67% availability percentage");
}

TEST_F(ReporterTest, ReportBlock) {
    reporter.report({{"fetch.com", 67}, {"www.fetchrewards.com", 50}});
    EXPECT_EQ(output.str(),
        "fetch.com has 67% availability percentage\n"
        "www.fetchrewards.com has 50% availability percentage\n"
        "---\n");
}

TEST_F(ReporterTest, KeepsSnapshotOrder) {
    reporter.report({{"zeta.org", 0}, {"alpha.com", 100}});
    auto text = output.str();
    EXPECT_LT(text.find("zeta.org"), text.find("alpha.com"));
}

TEST_F(ReporterTest, EmptySnapshotPrintsSeparator) {
    reporter.report({});
    EXPECT_EQ(output.str(), "---\n");
}

TEST_F(ReporterTest, ConsecutiveBlocks) {
    reporter.report({{"example.com", 100}});
    reporter.report({{"example.com", 50}});
    EXPECT_EQ(output.str(),
        "example.com has 100% availability percentage\n"
        "---\n"
        "example.com has 50% availability percentage\n"
        "---\n");
}
