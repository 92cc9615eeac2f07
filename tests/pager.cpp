#include <csignal> // for SIGTERM
#include <sstream> // for std::ostringstream
#include <system_error>

#include <gtest/gtest.h>

#include "mgmtsh/pager.hpp"

using namespace mgmtsh;

TEST(pager_options, defaults)
{
    const auto opts = pager_options{};
    EXPECT_EQ(opts.file, "less");
    EXPECT_EQ(opts.arguments, (std::vector<std::string>{"-F", "-X"}));
}

TEST(process_status, ostream)
{
    std::ostringstream os;
    os << process_status{exit_status{3}} << "; ";
    os << process_status{signaled_status{SIGTERM, false}};
    EXPECT_EQ(os.str(), "exit-status=3; signal=15, core-dumped=false");
}

TEST(page, reads_everything)
{
    const auto status = page("hello\n", pager_options{"cat", {}});
    EXPECT_EQ(status, process_status{exit_status{0}});
}

TEST(page, exit_status)
{
    EXPECT_EQ(page("", pager_options{"true", {}}),
              process_status{exit_status{0}});
    EXPECT_EQ(page("", pager_options{"false", {}}),
              process_status{exit_status{1}});
    EXPECT_EQ(page("", pager_options{"sh", {"-c", "exit 3"}}),
              process_status{exit_status{3}});
}

TEST(page, signaled)
{
    EXPECT_EQ((page("", pager_options{"sh", {"-c", "kill -TERM $$"}})),
              (process_status{signaled_status{SIGTERM, false}}));
}

TEST(page, missing_program)
{
    EXPECT_EQ(page("", pager_options{"/nonexistent/mgmtsh-pager", {}}),
              process_status{exit_status{127}});
}

TEST(page, early_exit)
{
    // Enough data to fill the pipe so writing fails once the pager is gone.
    const auto data = std::string(1024u * 1024u, 'x');
    EXPECT_THROW(page(data, pager_options{"true", {}}), std::system_error);
}

TEST(page_output, without_pager)
{
    std::ostringstream os;
    page_output(os, "a\nb", {});
    EXPECT_EQ(os.str(), "a\nb\n");
    page_output(os, "c\n", {});
    EXPECT_EQ(os.str(), "a\nb\nc\n");
}

TEST(page_output, with_pager)
{
    std::ostringstream os;
    EXPECT_NO_THROW(page_output(os, "text", pager_options{"cat", {}}));
    EXPECT_TRUE(empty(os.str()));
    EXPECT_THROW(page_output(os, "", pager_options{"false", {}}),
                 std::system_error);
}
