// tests/test_partition_emitter.cpp
//
// Partition emission:
//
//   E1: singletons dropped, ids allocated in creation order
//   E2: each cluster stored before it is dispatched, commits last
//   E3: sink failures become persistence errors
//   E4: size histogram
//   E5: a fan-out that fails to publish takes the cluster table with it

#include "pafclust/errors.hpp"
#include "pafclust/partition_emitter.hpp"

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace pafclust;

void expect(bool ok, const std::string& msg, int& failed) {
    if (!ok) {
        std::cerr << "  FAIL: " << msg << "\n";
        ++failed;
    }
}

class MemorySink : public ClusterSink {
public:
    explicit MemorySink(std::vector<std::string>* events = nullptr) : events_(events) {}

    std::map<uint64_t, std::vector<MemberId>> stored;
    uint64_t fail_on = 0;
    bool committed = false;

    void store(uint64_t cluster_id, const std::vector<MemberId>& members) override {
        if (cluster_id == fail_on) throw std::runtime_error("no space left on device");
        stored[cluster_id] = members;
        if (events_) events_->push_back("store " + std::to_string(cluster_id));
    }

    void commit() override {
        committed = true;
        if (events_) events_->push_back("commit");
    }

    void retract() override {
        committed = false;
        if (events_) events_->push_back("retract");
    }

private:
    std::vector<std::string>* events_;
};

class MemoryFanout : public FanoutSink {
public:
    explicit MemoryFanout(std::vector<std::string>* events) : events_(events) {}

    bool fail_prepare = false;
    bool fail_commit = false;

    void dispatch(uint64_t cluster_id) override {
        events_->push_back("dispatch " + std::to_string(cluster_id));
    }

    void prepare() override {
        if (fail_prepare) throw std::runtime_error("manifest close failed");
    }

    void commit() override {
        if (fail_commit) throw std::runtime_error("manifest rename failed");
        events_->push_back("commit fanout");
    }

private:
    std::vector<std::string>* events_;
};

// {3,4,1,2}, {9}, {10,11} in creation order
ClusterRegistry sample_registry() {
    ClusterRegistry reg;
    reg.unite(1, 2);
    reg.unite(3, 4);
    reg.find(9);
    reg.unite(4, 1);
    reg.unite(10, 11);
    return reg;
}

int test_ids_and_drop() {
    int failed = 0;
    std::cout << "[E1] id allocation and singleton drop\n";

    const ClusterRegistry reg = sample_registry();

    MemorySink sink;
    EmitStats stats = emit_partition(reg, sink, nullptr, 100);
    expect(stats.clusters_emitted == 2, "two clusters emitted", failed);
    expect(stats.singletons_dropped == 1, "singleton dropped", failed);
    expect(stats.members_emitted == 6, "six members emitted", failed);
    expect(stats.first_cluster_id == 100 && stats.last_cluster_id == 101, "id range", failed);
    expect(stats.largest_cluster == 4, "largest cluster", failed);
    expect(sink.committed, "sink committed", failed);

    expect(sink.stored.size() == 2, "two clusters stored", failed);
    expect(sink.stored[100] == (std::vector<MemberId>{3, 4, 1, 2}), "first id to oldest cluster",
           failed);
    expect(sink.stored[101] == (std::vector<MemberId>{10, 11}), "second id", failed);

    MemorySink from_one;
    stats = emit_partition(reg, from_one, nullptr);
    expect(from_one.stored.count(1) && from_one.stored.count(2), "ids start at 1 by default",
           failed);

    ClusterRegistry empty;
    MemorySink none;
    stats = emit_partition(empty, none, nullptr, 5);
    expect(stats.clusters_emitted == 0 && none.stored.empty(), "empty registry emits nothing",
           failed);
    expect(none.committed, "empty run still commits", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_store_before_dispatch() {
    int failed = 0;
    std::cout << "[E2] store before dispatch\n";

    std::vector<std::string> events;
    MemorySink sink(&events);
    MemoryFanout fanout(&events);
    emit_partition(sample_registry(), sink, &fanout, 7);

    const std::vector<std::string> expected = {
        "store 7", "dispatch 7", "store 8", "dispatch 8", "commit", "commit fanout"
    };
    expect(events == expected, "store, dispatch, then commits", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_sink_failure() {
    int failed = 0;
    std::cout << "[E3] sink failure\n";

    std::vector<std::string> events;
    MemorySink sink(&events);
    sink.fail_on = 2;
    MemoryFanout fanout(&events);

    bool threw = false;
    try {
        emit_partition(sample_registry(), sink, &fanout);
    } catch (const PhaseError& e) {
        threw = true;
        expect(e.phase() == RunPhase::PERSISTENCE, "persistence phase", failed);
        expect(e.genomes().empty(), "no genomes attached", failed);
        expect(std::string(e.what()) == "persistence failed: cluster 2: no space left on device",
               "message names the cluster", failed);
    }
    expect(threw, "failure raised", failed);
    expect(!sink.committed, "nothing committed after failure", failed);
    expect(events == (std::vector<std::string>{"store 1", "dispatch 1"}),
           "failed cluster never dispatched", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_fanout_publish_failure() {
    int failed = 0;
    std::cout << "[E5] fan-out publish failure\n";

    {
        std::vector<std::string> events;
        MemorySink sink(&events);
        MemoryFanout fanout(&events);
        fanout.fail_commit = true;

        std::string message;
        try {
            emit_partition(sample_registry(), sink, &fanout);
        } catch (const PhaseError& e) {
            message = e.what();
            expect(e.phase() == RunPhase::PERSISTENCE, "persistence phase", failed);
        }
        expect(message == "persistence failed: manifest rename failed", "manifest error reported",
               failed);
        expect(!sink.committed, "cluster table retracted", failed);
        expect(events == (std::vector<std::string>{"store 1", "dispatch 1", "store 2",
                                                   "dispatch 2", "commit", "retract"}),
               "commit then retract", failed);
    }

    {
        std::vector<std::string> events;
        MemorySink sink(&events);
        MemoryFanout fanout(&events);
        fanout.fail_prepare = true;

        bool threw = false;
        try {
            emit_partition(sample_registry(), sink, &fanout);
        } catch (const PhaseError&) {
            threw = true;
        }
        expect(threw, "prepare failure raised", failed);
        expect(!sink.committed, "cluster table never committed", failed);
        expect(events.back() == "dispatch 2", "no commit attempted", failed);
    }

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

int test_histogram() {
    int failed = 0;
    std::cout << "[E4] cluster size histogram\n";

    ClusterRegistry reg;
    MemberId next = 1;
    for (size_t size : {2u, 2u, 3u, 5u, 6u, 11u, 51u, 101u, 501u}) {
        const MemberId first = next++;
        for (size_t i = 1; i < size; ++i) reg.unite(first, next++);
    }

    MemorySink sink;
    const EmitStats stats = emit_partition(reg, sink, nullptr);
    const ClusterSizeHistogram& h = stats.histogram;
    expect(h.count(0) == 2, "bin 2", failed);
    expect(h.count(1) == 2, "bin 3-5", failed);
    expect(h.count(2) == 1, "bin 6-10", failed);
    expect(h.count(3) == 1, "bin 11-50", failed);
    expect(h.count(4) == 1, "bin 51-100", failed);
    expect(h.count(5) == 1, "bin 101-500", failed);
    expect(h.count(6) == 1, "bin >500", failed);
    expect(std::string(ClusterSizeHistogram::bin_label(6)) == ">500", "last bin label", failed);
    expect(stats.largest_cluster == 501, "largest", failed);

    if (!failed) std::cout << "  PASS\n";
    return failed;
}

}  // namespace

int main() {
    int failed = 0;
    failed += test_ids_and_drop();
    failed += test_store_before_dispatch();
    failed += test_sink_failure();
    failed += test_histogram();
    failed += test_fanout_publish_failure();

    if (failed) {
        std::cerr << "\n" << failed << " emitter check(s) failed.\n";
        return 1;
    }
    std::cout << "\nAll partition emitter tests passed.\n";
    return 0;
}
