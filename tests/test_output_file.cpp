// tests/test_output_file.cpp
//
// Output files and the cluster table writers:
//
//   O1: plain output appears only on commit
//   O2: uncommitted output leaves nothing behind
//   O3: gzip output decompresses to what was written
//   O4: zstd output (or a clear error without zstd support)
//   O5: cluster table and job manifest contents
//   O6: finish, publish and retract as separate steps
//   O7: a run whose job manifest cannot be published leaves no cluster table

#include "pafclust/cluster_registry.hpp"
#include "pafclust/cluster_writer.hpp"
#include "pafclust/errors.hpp"
#include "pafclust/output_file.hpp"
#include "pafclust/partition_emitter.hpp"

#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using namespace pafclust;
namespace fs = std::filesystem;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

std::string slurp(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string gunzip(const fs::path& path) {
    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) throw std::runtime_error("gzopen failed: " + path.string());
    std::string out;
    char buf[65536];
    int n;
    while ((n = gzread(gz, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
    gzclose(gz);
    if (n < 0) throw std::runtime_error("gzread failed: " + path.string());
    return out;
}

int test_plain_commit(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O1] plain output and commit\n";

    const fs::path path = dir / "plain.txt";
    {
        OutputFile out(path.string());
        expect(out.codec() == OutputFile::Codec::PLAIN, "plain codec", failed);
        expect(out.temp_path() == path.string() + ".tmp", "temporary name", failed);
        out.write("hello\n");
        out.write(std::string("world\n"));
        expect(fs::exists(out.temp_path()), "temporary exists before commit", failed);
        expect(!fs::exists(path), "final file absent before commit", failed);
        out.commit();
        expect(out.committed(), "committed flag", failed);
        out.commit();  // second commit is a no-op
    }
    expect(fs::exists(path), "final file present after commit", failed);
    expect(!fs::exists(path.string() + ".tmp"), "temporary renamed away", failed);
    expect(slurp(path) == "hello\nworld\n", "plain content", failed);

    // Writes larger than the buffer go straight through
    const fs::path big = dir / "big.txt";
    std::string expected;
    {
        OutputFile out(big.string());
        const std::string chunk(300000, 'x');
        for (int i = 0; i < 5; ++i) {
            out.write(chunk);
            expected += chunk;
        }
        const std::string huge(3 * 1024 * 1024, 'y');
        out.write(huge);
        expected += huge;
        out.write("tail\n");
        expected += "tail\n";
        out.commit();
    }
    expect(slurp(big) == expected, "large writes keep order", failed);

    bool threw = false;
    try {
        OutputFile out((dir / "no_such_dir" / "x.txt").string());
    } catch (const std::runtime_error&) {
        threw = true;
    }
    expect(threw, "uncreatable path rejected", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_uncommitted(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O2] uncommitted output removed\n";

    const fs::path path = dir / "aborted.tsv.gz";
    {
        OutputFile out(path.string());
        out.write("partial\n");
    }
    expect(!fs::exists(path), "no final file", failed);
    expect(!fs::exists(path.string() + ".tmp"), "no temporary", failed);

    // An existing file is only replaced by a successful commit
    const fs::path kept = dir / "kept.txt";
    {
        std::ofstream old(kept);
        old << "old\n";
    }
    {
        OutputFile out(kept.string());
        out.write("new\n");
    }
    expect(slurp(kept) == "old\n", "previous output untouched", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_gzip(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O3] gzip output\n";

    const fs::path path = dir / "clusters.tsv.gz";
    std::string expected;
    {
        OutputFile out(path.string(), 6);
        expect(out.codec() == OutputFile::Codec::GZIP, "gzip codec", failed);
        for (int i = 0; i < 50000; ++i) {
            const std::string line = std::to_string(i) + "\t" + std::to_string(i * 7) + "\n";
            out.write(line);
            expected += line;
        }
        out.commit();
    }

    const std::string raw = slurp(path);
    expect(raw.size() > 2 && static_cast<unsigned char>(raw[0]) == 0x1f &&
               static_cast<unsigned char>(raw[1]) == 0x8b,
           "gzip magic", failed);
    expect(raw.size() < expected.size(), "compressed", failed);
    expect(gunzip(path) == expected, "round trip through zlib", failed);

    expect(OutputFile::codec_for_path("a.gz") == OutputFile::Codec::GZIP, "suffix .gz", failed);
    expect(OutputFile::codec_for_path("a.zst") == OutputFile::Codec::ZSTD, "suffix .zst", failed);
    expect(OutputFile::codec_for_path("a.tsv") == OutputFile::Codec::PLAIN, "suffix .tsv", failed);
    expect(OutputFile::codec_for_path(".gz") == OutputFile::Codec::PLAIN, "bare suffix", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_zstd(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O4] zstd output\n";

    const fs::path path = dir / "clusters.tsv.zst";
#ifdef HAVE_ZSTD
    {
        OutputFile out(path.string());
        out.write("1\t2\n1\t3\n");
        out.commit();
    }
    const std::string raw = slurp(path);
    expect(raw.size() >= 4 && static_cast<unsigned char>(raw[0]) == 0x28 &&
               static_cast<unsigned char>(raw[1]) == 0xb5 &&
               static_cast<unsigned char>(raw[2]) == 0x2f &&
               static_cast<unsigned char>(raw[3]) == 0xfd,
           "zstd frame magic", failed);
#else
    std::string message;
    try {
        OutputFile out(path.string());
    } catch (const std::runtime_error& e) {
        message = e.what();
    }
    expect(message.find("without ZSTD support") != std::string::npos,
           "clear error without zstd", failed);
    expect(!fs::exists(path.string() + ".tmp"), "no temporary created", failed);
#endif

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_cluster_writers(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O5] cluster table and job manifest\n";

    const fs::path table = dir / "clusters.tsv";
    const fs::path jobs = dir / "jobs.txt";
    {
        TsvClusterWriter writer(table.string());
        JobManifestWriter manifest(jobs.string());
        writer.store(1, {10, 20});
        manifest.dispatch(1);
        writer.store(2, {30, 5, 7});
        manifest.dispatch(2);
        expect(!fs::exists(table), "table hidden until commit", failed);
        writer.commit();
        manifest.commit();
    }
    expect(slurp(table) ==
               "cluster_id\tmember_id\n"
               "1\t10\n1\t20\n"
               "2\t30\n2\t5\n2\t7\n",
           "table rows in member order", failed);
    expect(slurp(jobs) == "1\n2\n", "one job per cluster", failed);

    const fs::path bare = dir / "bare.tsv";
    {
        TsvClusterWriter writer(bare.string(), false);
        writer.store(9, {1, 2});
        writer.commit();
    }
    expect(slurp(bare) == "9\t1\n9\t2\n", "table without header", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_two_step_commit(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O6] finish, publish, retract\n";

    const fs::path path = dir / "staged.tsv.gz";
    {
        OutputFile out(path.string());
        out.write("1\t2\n");
        out.finish();
        expect(out.finished() && !out.committed(), "finished but not published", failed);
        expect(fs::exists(out.temp_path()) && !fs::exists(path), "still a temporary", failed);

        bool threw = false;
        try {
            out.write("late\n");
        } catch (const std::logic_error&) {
            threw = true;
        }
        expect(threw, "write after finish rejected", failed);

        out.publish();
        expect(out.committed() && fs::exists(path), "published", failed);
        expect(gunzip(path) == "1\t2\n", "gzip stream closed before rename", failed);

        out.retract();
        expect(!out.committed() && !fs::exists(path), "retracted", failed);
        out.retract();  // nothing left to remove
    }
    expect(!fs::exists(path.string() + ".tmp"), "no temporary after retract", failed);

    // A finished but unpublished file is discarded like an unfinished one
    const fs::path dropped = dir / "dropped.txt";
    {
        OutputFile out(dropped.string());
        out.write("x\n");
        out.finish();
    }
    expect(!fs::exists(dropped) && !fs::exists(dropped.string() + ".tmp"),
           "finished temporary removed", failed);

    // A directory in the way is caught before anything is renamed
    const fs::path blocked = dir / "blocked";
    fs::create_directories(blocked / "inside");
    {
        OutputFile out(blocked.string());
        out.write("x\n");
        std::string message;
        try {
            out.finish();
        } catch (const std::runtime_error& e) {
            message = e.what();
        }
        expect(message.find("is a directory") != std::string::npos, "directory target rejected",
               failed);

        bool threw = false;
        try {
            out.publish();
        } catch (const std::logic_error&) {
            threw = true;
        }
        expect(threw, "publish refused after a failed finish", failed);
    }
    expect(fs::is_directory(blocked / "inside"), "directory untouched", failed);
    expect(!fs::exists(blocked.string() + ".tmp"), "temporary removed", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_run_atomicity(const fs::path& dir) {
    int failed = 0;
    std::cout << "[O7] cluster table not published when the job manifest fails\n";

    const fs::path run_dir = dir / "atomic_run";
    const fs::path table = run_dir / "clusters.tsv";
    const fs::path jobs = run_dir / "jobs";
    fs::create_directories(jobs / "previous_run");

    ClusterRegistry reg;
    reg.unite(1, 2);
    reg.unite(3, 4);

    std::string message;
    {
        TsvClusterWriter writer(table.string());
        JobManifestWriter manifest(jobs.string());
        try {
            emit_partition(reg, writer, &manifest);
        } catch (const PhaseError& e) {
            message = e.what();
            expect(e.phase() == RunPhase::PERSISTENCE, "persistence phase", failed);
        }
    }
    expect(message.find("persistence failed:") == 0, "run failed", failed);
    expect(message.find(jobs.string()) != std::string::npos, "message names the manifest",
           failed);
    expect(!fs::exists(table), "no cluster table after failed run", failed);
    expect(!fs::exists(table.string() + ".tmp"), "no cluster table temporary", failed);
    expect(!fs::exists(jobs.string() + ".tmp"), "no manifest temporary", failed);

    // The same run with a usable manifest path publishes both
    fs::remove_all(jobs);
    {
        TsvClusterWriter writer(table.string());
        JobManifestWriter manifest(jobs.string());
        emit_partition(reg, writer, &manifest);
    }
    expect(slurp(table) == "cluster_id\tmember_id\n1\t1\n1\t2\n2\t3\n2\t4\n",
           "table published", failed);
    expect(slurp(jobs) == "1\n2\n", "manifest published", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    const fs::path dir = fs::temp_directory_path() /
                         ("pafclust_out_test_" + std::to_string(::getpid()));
    fs::create_directories(dir);

    int failed = 0;
    failed += test_plain_commit(dir);
    failed += test_uncommitted(dir);
    failed += test_gzip(dir);
    failed += test_zstd(dir);
    failed += test_cluster_writers(dir);
    failed += test_two_step_commit(dir);
    failed += test_run_atomicity(dir);

    std::error_code ec;
    fs::remove_all(dir, ec);

    if (failed) {
        std::cerr << "\n" << failed << " output check(s) failed.\n";
        return 1;
    }
    std::cout << "\nAll output file tests passed.\n";
    return 0;
}
