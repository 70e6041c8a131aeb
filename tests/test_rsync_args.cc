#define BOOST_TEST_MODULE "RsyncArgsModule"

#include <algorithm>
#include <type_traits>
#include <string>
#include <vector>
#include <boost/test/unit_test.hpp>

#include "CopyEngine.h"
#include "PipeExec.h"
#include "globalsdef.h"

using namespace std;


static bool has(const vector<string> &args, string arg)
{
    return find(args.begin(), args.end(), arg) != args.end();
}

static RunConfig missingRsync()
{
    RunConfig config;
    config.rsync = "/nonexistent/bin/rsync";
    return config;
}


BOOST_AUTO_TEST_CASE(Copy_Preserves_Everything)
{
    auto config = missingRsync();
    RsyncEngine engine(config);

    auto args = engine.buildArgs(CopyRequest("/", "/backups/2025-01-01-backup-full", {}, cmCopy));

    BOOST_REQUIRE(args.size() >= 5);
    BOOST_CHECK_EQUAL(args[0], "/nonexistent/bin/rsync");
    BOOST_CHECK(has(args, "-aAXH"));
    BOOST_CHECK(has(args, "--numeric-ids"));
    BOOST_CHECK(!has(args, "--delete"));
    BOOST_CHECK_EQUAL(args[args.size() - 2], "/");
    BOOST_CHECK_EQUAL(args.back(), "/backups/2025-01-01-backup-full");
}

BOOST_AUTO_TEST_CASE(Source_Gets_A_Trailing_Slash)
{
    auto config = missingRsync();
    RsyncEngine engine(config);

    auto args = engine.buildArgs(CopyRequest("/backups/2025-01-01-backup-full", "/", {}, cmMirror));
    BOOST_CHECK_EQUAL(args[args.size() - 2], "/backups/2025-01-01-backup-full/");
    BOOST_CHECK(has(args, "--delete"));
    BOOST_CHECK(!has(args, "--dry-run"));
}

BOOST_AUTO_TEST_CASE(Delete_Only_Transfers_Nothing)
{
    auto config = missingRsync();
    RsyncEngine engine(config);

    auto args = engine.buildArgs(CopyRequest("/", "/backups/full", {}, cmDeleteOnly));
    BOOST_CHECK(has(args, "--delete"));
    BOOST_CHECK(has(args, "--existing"));
    BOOST_CHECK(has(args, "--ignore-existing"));
}

BOOST_AUTO_TEST_CASE(Report_Mode_Is_A_Dry_Run)
{
    auto config = missingRsync();
    RsyncEngine engine(config);

    auto args = engine.buildArgs(CopyRequest("/", "/backups/full", {}, cmReportDeletions));
    BOOST_CHECK(has(args, "--dry-run"));
    BOOST_CHECK(has(args, "--delete"));
    BOOST_CHECK(has(args, "--info=del1"));
}

BOOST_AUTO_TEST_CASE(Link_Mode_Names_The_Reference)
{
    auto config = missingRsync();
    RsyncEngine engine(config);

    auto args = engine.buildArgs(CopyRequest("/", "/backups/inc", {}, cmLinkReference, "/backups/2025-01-01-backup-full"));
    BOOST_CHECK(has(args, "--link-dest=/backups/2025-01-01-backup-full"));
    BOOST_CHECK(!has(args, "--delete"));
}

BOOST_AUTO_TEST_CASE(Excludes_And_Nice_Are_Passed)
{
    auto config = missingRsync();
    config.nice = 10;
    RsyncEngine engine(config);

    auto args = engine.buildArgs(CopyRequest("/", "/backups/full", { "/proc/*", "/backups/*" }, cmCopy));
    BOOST_REQUIRE(args.size() > 3);
    BOOST_CHECK_EQUAL(args[0], "nice");
    BOOST_CHECK_EQUAL(args[1], "-n");
    BOOST_CHECK_EQUAL(args[2], "10");
    BOOST_CHECK_EQUAL(args[3], "/nonexistent/bin/rsync");
    BOOST_CHECK(has(args, "--exclude=/proc/*"));
    BOOST_CHECK(has(args, "--exclude=/backups/*"));
}

BOOST_AUTO_TEST_CASE(Missing_Binary_Is_Unavailable)
{
    auto config = missingRsync();
    RsyncEngine engine(config);
    string detail;

    BOOST_CHECK(!engine.available(detail));
    BOOST_CHECK(detail.find("/nonexistent/bin/rsync") != string::npos);
}

BOOST_AUTO_TEST_CASE(Failed_Exec_Is_A_Failed_Outcome)
{
    auto config = missingRsync();
    RsyncEngine engine(config);

    auto outcome = engine.run(CopyRequest("/nonexistent/a", "/nonexistent/b", {}, cmCopy));
    BOOST_CHECK(!outcome.success);
    BOOST_CHECK(outcome.exitCode != 0);
}

BOOST_AUTO_TEST_CASE(Mode_Names)
{
    BOOST_CHECK_EQUAL(copyModeName(cmMirror), "copy-with-delete");
    BOOST_CHECK_EQUAL(copyModeName(cmReportDeletions), "report-deletions");
    BOOST_CHECK_EQUAL(copyModeName(cmLinkReference), "link-against-reference");
}

BOOST_AUTO_TEST_CASE(Child_Process_Handle_Is_Not_Copyable)
{
    BOOST_CHECK(!is_copy_constructible<PipeExec>::value);
    BOOST_CHECK(!is_copy_assignable<PipeExec>::value);

    PipeExec child({ "/bin/sh", "-c", "echo first; echo second; exit 3" });
    BOOST_REQUIRE_EQUAL(child.execute(true), 0);

    string line;
    vector<string> lines;
    while (child.readLine(line))
        lines.push_back(line);

    BOOST_CHECK_EQUAL(child.wait(), 3);
    BOOST_REQUIRE_EQUAL(lines.size(), 2u);
    BOOST_CHECK_EQUAL(lines[0], "first");
    BOOST_CHECK_EQUAL(lines[1], "second");
}
