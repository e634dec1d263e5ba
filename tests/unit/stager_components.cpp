#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "mock_cluster.hpp"
#include "tierstage/logger.hpp"
#include "tierstage/stager/codecs.hpp"
#include "tierstage/stager/command_runner.hpp"
#include "tierstage/stager/errors.hpp"
#include "tierstage/stager/file_stager.hpp"
#include "tierstage/stager/staging_session.hpp"
#include "tierstage/stager/transfer_client.hpp"
#include "tierstage/stager/workspace.hpp"

using namespace tierstage;
using namespace tierstage::stager;
using namespace std::chrono_literals;
using tierstage::testing::MockCluster;
using tierstage::testing::throws;

namespace
{

    bool has_code(ErrorCode code, const std::function<void()> &fn)
    {
        try
        {
            fn();
        }
        catch (const StagingError &ex)
        {
            return ex.code() == code;
        }
        return false;
    }

    // Version 1.0 magic, length prefix and a header padded to 64 bytes.
    std::string npy_preamble(std::string header)
    {
        header.append(63 - (10 + header.size()) % 64, ' ');
        header += '\n';
        std::string bytes("\x93NUMPY\x01\x00", 8);
        bytes += static_cast<char>(header.size() & 0xff);
        bytes += static_cast<char>(header.size() >> 8);
        bytes += header;
        return bytes;
    }

    void test_runner_captures_output()
    {
        CommandRunner runner(Logger{}, 10ms);
        auto job = runner.launch({"/bin/sh", "-c", "echo out; echo err >&2; exit 3"});
        assert(job->state() == JobState::Running || job->state() == JobState::Done);
        assert(runner.wait(*job) == 3);
        assert(job->state() == JobState::Done);
        assert(job->exit_code() == 3);

        const auto output = runner.drain(*job);
        assert(output.out == "out\n");
        assert(output.err == "err\n");
        assert(job->drained());
        assert(has_code(ErrorCode::InvalidState, [&] { (void)runner.drain(*job); }));
        assert(runner.jobs_launched() == 1);
    }

    void test_runner_timeout_leaves_job_running()
    {
        CommandRunner runner(Logger{}, 10ms);
        auto job = runner.launch({"/bin/sh", "-c", "sleep 1; echo late"});
        assert(!runner.poll(*job));
        assert(!runner.wait(*job, 50ms));
        assert(job->state() == JobState::Running);
        assert(has_code(ErrorCode::InvalidState, [&] { (void)runner.drain(*job); }));

        assert(runner.wait(*job) == 0);
        assert(runner.drain(*job).out == "late\n");
    }

    void test_runner_large_output()
    {
        CommandRunner runner(Logger{}, 10ms);
        auto job = runner.launch({"seq", "1", "50000"});
        assert(runner.wait(*job) == 0);
        const auto output = runner.drain(*job);
        assert(std::count(output.out.begin(), output.out.end(), '\n') == 50000);
        assert(output.out.rfind("50000\n") == output.out.size() - 6);
    }

    void test_runner_launch_failures()
    {
        CommandRunner runner(Logger{}, 10ms);
        assert(has_code(ErrorCode::LaunchFailed, [&] { (void)runner.launch({"/nonexistent/tierstage-tool"}); }));
        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)runner.launch({}); }));

        auto job = runner.launch({"/bin/sh", "-c", "kill -TERM $$"});
        assert(runner.wait(*job) == 128 + 15);
    }

    void test_transfer_client_commands()
    {
        TransferToolConfig config;
        config.bin_dir = "/opt/dt/bin";
        CommandRunner runner(Logger{}, 10ms);
        TransferClient client(config, runner, Logger{});

        assert((client.copy_command(true, "/fs/a", "/cache/a") ==
                std::vector<std::string>{"/opt/dt/bin/dtcp", "-r", "/fs/a", "/cache/a"}));
        assert((client.copy_command(false, "/fs/a", "/cache/a") ==
                std::vector<std::string>{"/opt/dt/bin/dtcp", "/fs/a", "/cache/a"}));
        assert((client.remove_command(true, "/p/x") == std::vector<std::string>{"/opt/dt/bin/dtrm", "-r", "/p/x"}));
        assert((client.list_command("/fs", 0) == std::vector<std::string>{"/opt/dt/bin/dtls", "-1", "/fs"}));
        assert((client.list_command("/fs", -1) == std::vector<std::string>{"/opt/dt/bin/dtls", "-R1", "/fs"}));
        assert((client.move_command("/s/a", "/d/a") == std::vector<std::string>{"/opt/dt/bin/dtmv", "/s/a", "/d/a"}));
        assert((client.tree_sync_command({"-a", "--delete"}, "/p/", "/fs") ==
                std::vector<std::string>{"/opt/dt/bin/dtrsync", "-a", "--delete", "/p/", "/fs"}));

        config.bin_dir.clear();
        TransferClient on_path(config, runner, Logger{});
        assert(on_path.move_command("a", "b").front() == "dtmv");
    }

    void test_transfer_client_reports_exit_codes()
    {
        MockCluster cluster("transfer");
        CommandRunner runner(Logger{}, 10ms);
        TransferClient client(cluster.config().transfer, runner, Logger{});

        MockCluster::write_file(cluster.fileserver() / "a.txt", "alpha");
        auto copy = client.copy(false, (cluster.fileserver() / "a.txt").string(), (cluster.root() / "a.txt").string());
        assert(runner.wait(*copy) == 0);
        assert(MockCluster::read_file(cluster.root() / "a.txt") == "alpha");

        auto missing = client.copy(true, (cluster.fileserver() / "none").string(), (cluster.root() / "none").string());
        const auto exit_code = runner.wait(*missing);
        assert(exit_code && *exit_code > 0);
        assert(!runner.drain(*missing).err.empty());
    }

    void test_workspace_allocation()
    {
        MockCluster cluster("workspace");
        CommandRunner runner(Logger{}, 10ms);
        auto config = cluster.config().workspace;
        config.filesystem = "scratch";
        WorkspaceAllocator allocator(config, runner, Logger{});

        assert((allocator.allocate_command(5) ==
                std::vector<std::string>{(cluster.bin() / "ws_allocate").string(), "-F", "scratch", "cache_ws", "5"}));

        const auto workspace = allocator.allocate();
        assert(workspace.name == "cache_ws");
        assert(workspace.path == cluster.scratch() / "cache_ws");
        assert(std::filesystem::is_directory(workspace.path));
        assert(allocator.allocate(2).path == workspace.path);

        allocator.release(workspace.name);
        assert(!std::filesystem::exists(workspace.path));
        allocator.release(workspace.name);

        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)allocator.allocate(0); }));

        cluster.add_tool("ws_broken", "echo \"quota exceeded\" >&2\nexit 2");
        auto broken_config = config;
        broken_config.allocate_command = "ws_broken";
        broken_config.release_command = "ws_broken";
        WorkspaceAllocator broken(broken_config, runner, Logger{});
        assert(has_code(ErrorCode::WorkspaceError, [&] { (void)broken.allocate(); }));
        assert(has_code(ErrorCode::WorkspaceError, [&] { broken.release("cache_ws"); }));
    }

    void test_text_json_csv_codecs()
    {
        const auto dir = std::filesystem::temp_directory_path() / "tierstage_codec_test";
        std::filesystem::create_directories(dir);

        TextCodec text;
        text.save(dir / "note.txt", "line one\nline two\n");
        assert(text.load(dir / "note.txt") == "line one\nline two\n");

        JsonCodec json;
        const nlohmann::json document{{"name", "sample"}, {"values", {1, 2, 3}}};
        json.save(dir / "doc.json", document);
        assert(json.load(dir / "doc.json") == document);
        MockCluster::write_file(dir / "broken.json", "{\"name\": ");
        assert(has_code(ErrorCode::FormatError, [&] { (void)json.load(dir / "broken.json"); }));

        CsvCodec csv;
        const Table table{{"id", "comment"}, {"1", "plain"}, {"2", "has, comma"}, {"3", "say \"hi\""},
                          {"4", "two\nlines"}};
        csv.save(dir / "table.csv", table);
        assert(csv.load(dir / "table.csv") == table);
        assert(MockCluster::read_file(dir / "table.csv").find("\"say \"\"hi\"\"\"") != std::string::npos);

        MockCluster::write_file(dir / "plain.csv", "x,y\r\n1,2\r\n,\n");
        assert((csv.load(dir / "plain.csv") == Table{{"x", "y"}, {"1", "2"}, {"", ""}}));
        MockCluster::write_file(dir / "open.csv", "a,\"unterminated\n");
        assert(has_code(ErrorCode::FormatError, [&] { (void)csv.load(dir / "open.csv"); }));

        CsvCodec tabs('\t');
        tabs.save(dir / "table.tsv", {{"a b", "c,d"}});
        assert(MockCluster::read_file(dir / "table.tsv") == "a b\tc,d\n");

        assert(has_code(ErrorCode::FormatError, [&] { (void)text.load(dir / "missing.txt"); }));
        std::filesystem::remove_all(dir);
    }

    void test_npy_codec()
    {
        const auto dir = std::filesystem::temp_directory_path() / "tierstage_npy_test";
        std::filesystem::create_directories(dir);
        NpyCodec npy;

        const NdArray vector{.shape = {3}, .data = {1.0, 2.0, 3.0}};
        npy.save(dir / "vector.npy", vector);
        assert(npy.load(dir / "vector.npy") == vector);
        const auto size = std::filesystem::file_size(dir / "vector.npy");
        assert((size - 3 * sizeof(double)) % 64 == 0);
        assert(MockCluster::read_file(dir / "vector.npy").find("'shape': (3,)") != std::string::npos);

        const NdArray matrix{.shape = {2, 3}, .data = {0.5, -1.0, 2.25, 3.0, 4.0, 1e-3}};
        npy.save(dir / "matrix.npy", matrix);
        assert(npy.load(dir / "matrix.npy") == matrix);

        // Little-endian int32 array written the way numpy 1.x does.
        std::string bytes = npy_preamble("{'descr': '<i4', 'fortran_order': False, 'shape': (2,), }");
        const std::int32_t values[2] = {7, -1};
        bytes.append(reinterpret_cast<const char *>(values), sizeof(values));
        MockCluster::write_file(dir / "ints.npy", bytes);
        const auto ints = npy.load(dir / "ints.npy");
        assert((ints.shape == std::vector<std::size_t>{2}));
        assert((ints.data == std::vector<double>{7.0, -1.0}));

        auto fortran = bytes;
        fortran.replace(fortran.find("False,"), 6, "True, ");
        MockCluster::write_file(dir / "fortran.npy", fortran);
        assert(has_code(ErrorCode::FormatError, [&] { (void)npy.load(dir / "fortran.npy"); }));

        MockCluster::write_file(dir / "truncated.npy", bytes.substr(0, bytes.size() - 2));
        assert(has_code(ErrorCode::FormatError, [&] { (void)npy.load(dir / "truncated.npy"); }));
        MockCluster::write_file(dir / "text.npy", "not numpy at all");
        assert(has_code(ErrorCode::FormatError, [&] { (void)npy.load(dir / "text.npy"); }));

        // Dimensions whose product wraps around must not pass the size check.
        MockCluster::write_file(dir / "huge.npy",
                                npy_preamble("{'descr': '<f8', 'fortran_order': False, "
                                             "'shape': (4294967296, 4294967296), }"));
        assert(has_code(ErrorCode::FormatError, [&] { (void)npy.load(dir / "huge.npy"); }));
        MockCluster::write_file(dir / "oversized.npy",
                                npy_preamble("{'descr': '<f8', 'fortran_order': False, "
                                             "'shape': (2305843009213693952,), }"));
        assert(has_code(ErrorCode::FormatError, [&] { (void)npy.load(dir / "oversized.npy"); }));
        MockCluster::write_file(dir / "negative.npy",
                                npy_preamble("{'descr': '<f8', 'fortran_order': False, 'shape': (-1,), }") +
                                    std::string(8, '\0'));
        assert(has_code(ErrorCode::FormatError, [&] { (void)npy.load(dir / "negative.npy"); }));

        std::filesystem::remove_all(dir);
    }

    void test_resolve_from_fileserver()
    {
        MockCluster cluster("resolve_remote");
        NpyCodec npy;
        const NdArray data{.shape = {3}, .data = {1.0, 2.0, 3.0}};
        npy.save(cluster.fileserver() / "testdata.npy", data);

        StagingSession session(cluster.config());
        assert(std::filesystem::is_directory(cluster.project()));
        const auto before = session.runner().jobs_launched();

        const auto path = session.resolve("testdata.npy");
        assert(path == session.stager().cache_dir() / "testdata.npy");
        assert(path.string().find("/scratch/") != std::string::npos);
        assert(session.runner().jobs_launched() == before + 1);
        assert(npy.load(path) == data);
        assert(session.list_cache_files() == std::vector<std::string>{"testdata.npy"});

        // Cached copies are served even after the remote file changes.
        npy.save(cluster.fileserver() / "testdata.npy", NdArray{.shape = {1}, .data = {9.0}});
        assert(session.load("testdata.npy", npy) == data);
        assert(session.runner().jobs_launched() == before + 1);
    }

    void test_resolve_prefers_local_tiers()
    {
        MockCluster cluster("resolve_local");
        StagingSession session(cluster.config());
        const auto before = session.runner().jobs_launched();
        TextCodec text;

        MockCluster::write_file(cluster.project() / "shared.txt", "project copy");
        MockCluster::write_file(cluster.fileserver() / "shared.txt", "fileserver copy");
        assert(session.resolve("shared.txt") == session.stager().local_root() / "shared.txt");
        assert(session.load("shared.txt", text) == "project copy");

        MockCluster::write_file(cluster.project() / "nested" / "deep.txt", "nested");
        assert(session.load("nested\\deep.txt", text) == "nested");

        const auto outside = cluster.root() / "elsewhere.txt";
        MockCluster::write_file(outside, "as given");
        assert(session.resolve(outside.string()) == outside);
        assert(session.runner().jobs_launched() == before);

        MockCluster::write_file(cluster.fileserver() / "sub" / "data.txt", "remote nested");
        assert(session.resolve("sub\\data.txt") == session.stager().cache_dir() / "data.txt");
        assert(session.load("sub/data.txt", text) == "remote nested");
        assert(session.runner().jobs_launched() == before + 1);
    }

    void test_resolve_missing_file()
    {
        MockCluster cluster("resolve_missing");
        StagingSession session(cluster.config());
        const auto before = session.runner().jobs_launched();

        bool caught = false;
        try
        {
            (void)session.resolve("missing.npy");
        }
        catch (const NotFoundError &ex)
        {
            caught = true;
            assert(ex.code() == ErrorCode::NotFound);
            assert(ex.logical_name() == "missing.npy");
            assert(ex.remote_path() == session.stager().remote_root() / "missing.npy");
        }
        assert(caught);
        assert(session.runner().jobs_launched() == before + 1);
        assert(!std::filesystem::exists(session.stager().cache_dir() / "missing.npy"));

        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)session.resolve(""); }));

        // Names may not climb out of the fileserver directory.
        MockCluster::write_file(cluster.fileserver().parent_path() / "escape.txt", "neighbour");
        const auto launched = session.runner().jobs_launched();
        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)session.resolve("sub/../../escape.txt"); }));
        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)session.resolve("..\\..\\escape.txt"); }));
        assert(session.runner().jobs_launched() == launched);
        assert(!std::filesystem::exists(session.stager().cache_dir() / "escape.txt"));
    }

    void test_resolve_timeout()
    {
        MockCluster cluster("resolve_timeout");
        cluster.add_tool("slowcp", "sleep 1\nexec cp \"$@\"");
        auto config = cluster.config();
        config.transfer.copy_command = "slowcp";
        MockCluster::write_file(cluster.fileserver() / "big.txt", "payload");

        StagingSession session(config);
        bool caught = false;
        try
        {
            (void)session.resolve("big.txt", 100ms);
        }
        catch (const TimeoutError &ex)
        {
            caught = true;
            assert(ex.command().front() == (cluster.bin() / "slowcp").string());
        }
        assert(caught);

        // The abandoned copy still lands in the cache.
        std::this_thread::sleep_for(1500ms);
        const auto before = session.runner().jobs_launched();
        assert(session.load("big.txt", TextCodec{}) == "payload");
        assert(session.runner().jobs_launched() == before);
    }

    void test_stage_to_each_tier()
    {
        MockCluster cluster("stage");
        StagingSession session(cluster.config());
        TextCodec text;

        const auto remote = session.stage(std::string("for the fileserver"), "saved.txt", text, Tier::Remote);
        assert(remote == session.stager().remote_root() / "saved.txt");
        assert(MockCluster::read_file(cluster.fileserver() / "saved.txt") == "for the fileserver");
        assert(session.load("saved.txt", text) == "for the fileserver");
        assert(session.list_cache_files() == std::vector<std::string>{"saved.txt"});

        const auto local = session.stage(std::string("for the project"), "out/result.txt", text, Tier::Local);
        assert(local == session.stager().local_root() / "out" / "result.txt");
        assert(MockCluster::read_file(local) == "for the project");

        const auto cached = session.stage(std::string("scratch notes"), "notes\\today.txt", text, Tier::Cache);
        assert(cached == session.stager().cache_dir() / "today.txt");
        assert(session.load("today.txt", text) == "scratch notes");

        const NdArray array{.shape = {2}, .data = {4.0, 5.0}};
        session.stage(array, "array.npy", NpyCodec{}, Tier::Remote);
        assert(NpyCodec{}.load(cluster.fileserver() / "array.npy") == array);

        // Scratch directories are gone once the move finished.
        assert(!std::filesystem::exists(session.stager().cache_dir() / ".scratch") ||
               std::filesystem::is_empty(session.stager().cache_dir() / ".scratch"));
    }

    void test_stage_move_failure()
    {
        MockCluster cluster("stage_failure");
        StagingSession session(cluster.config());
        bool caught = false;
        try
        {
            session.stage(std::string("x"), "no/such/dir/file.txt", TextCodec{}, Tier::Remote);
        }
        catch (const TransferFailedError &ex)
        {
            caught = true;
            assert(ex.logical_path() == "no/such/dir/file.txt");
            assert(ex.exit_code() > 0);
        }
        assert(caught);
    }

    void test_remove_from_project_space()
    {
        MockCluster cluster("remove");
        StagingSession session(cluster.config());

        MockCluster::write_file(cluster.project() / "old.txt", "stale");
        assert(session.remove_and_wait("old.txt"));
        assert(!std::filesystem::exists(cluster.project() / "old.txt"));

        MockCluster::write_file(cluster.project() / "results" / "a.csv", "1");
        auto job = session.remove("results");
        assert(session.runner().wait(*job) == 0);
        assert(!std::filesystem::exists(cluster.project() / "results"));

        assert(throws<TransferFailedError>([&] { (void)session.remove_and_wait("never-existed.txt"); }));
        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)session.remove("../escape.txt"); }));
        assert(has_code(ErrorCode::InvalidArgument, [&] { (void)session.remove("/etc/passwd"); }));

        cluster.add_tool("slowrm", "sleep 1\nexec rm \"$@\"");
        auto config = cluster.config();
        config.transfer.remove_command = "slowrm";
        config.workspace.name = "slow_ws";
        StagingSession slow(config);
        MockCluster::write_file(cluster.project() / "later.txt", "x");
        assert(!slow.remove_and_wait("later.txt", 50ms));
    }

    void test_listings()
    {
        MockCluster cluster("listing");
        StagingSession session(cluster.config());
        MockCluster::write_file(cluster.fileserver() / "a.txt", "a");
        MockCluster::write_file(cluster.fileserver() / "sub" / "b.txt", "b");
        MockCluster::write_file(cluster.project() / "local.txt", "l");

        assert((session.list_remote_files() == std::vector<std::string>{"a.txt", "sub", "sub/b.txt"}));
        assert((session.list_remote_files(0) == std::vector<std::string>{"a.txt", "sub"}));
        assert((session.list_remote_files(1) == std::vector<std::string>{"a.txt", "sub", "sub/b.txt"}));

        const auto local = session.list_local_files();
        assert(local.size() == 1);
        assert(local.front() == (session.stager().local_root() / "local.txt").string());

        const auto parsed = FileStager::parse_listing("/fs:\na\nd\n\n/fs/d:\ne\nf\n\n/fs/d/f:\ng\n", "/fs", 1);
        assert((parsed == std::vector<std::string>{"a", "d", "d/e", "d/f"}));
        assert(FileStager::parse_listing("", "/fs", -1).empty());
        assert(FileStager::base_name("dir/sub/") == "sub");
        assert(FileStager::normalize_name("a\\b\\c.txt") == "a/b/c.txt");
    }

    void test_close_cleans_up()
    {
        MockCluster cluster("close");
        MockCluster::write_file(cluster.fileserver() / "data.txt", "d");
        std::filesystem::path cache_dir;
        {
            StagingSession session(cluster.config());
            cache_dir = session.stager().cache_dir();
            (void)session.resolve("data.txt");
            assert(std::filesystem::exists(cache_dir / "data.txt"));

            session.close();
            assert(!std::filesystem::exists(cache_dir));
            assert(!std::filesystem::exists(cluster.scratch() / "cache_ws"));
            assert(!session.stager().is_open());
            session.close();
            assert(has_code(ErrorCode::InvalidState, [&] { (void)session.resolve("data.txt"); }));
        }

        // A fixed cache root skips workspace allocation; the stager only owns its subdirectory.
        auto config = cluster.config();
        config.workspace.cache_root = cluster.root() / "fixed";
        {
            StagingSession session(config);
            assert(session.runner().jobs_launched() == 0);
            assert(session.stager().cache_dir() == cluster.root() / "fixed" / "cache");
            (void)session.resolve("data.txt");
        }
        assert(!std::filesystem::exists(cluster.root() / "fixed" / "cache"));
        assert(std::filesystem::exists(cluster.root() / "fixed"));
        assert(MockCluster::read_file(cluster.fileserver() / "data.txt") == "d");
    }

} // namespace

void run_stager_component_tests()
{
    test_runner_captures_output();
    test_runner_timeout_leaves_job_running();
    test_runner_large_output();
    test_runner_launch_failures();
    test_transfer_client_commands();
    test_transfer_client_reports_exit_codes();
    test_workspace_allocation();
    test_text_json_csv_codecs();
    test_npy_codec();
    test_resolve_from_fileserver();
    test_resolve_prefers_local_tiers();
    test_resolve_missing_file();
    test_resolve_timeout();
    test_stage_to_each_tier();
    test_stage_move_failure();
    test_remove_from_project_space();
    test_listings();
    test_close_cleans_up();
}
