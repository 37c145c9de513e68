#include <mqconsumer/utils/mqconsumer_snapshot.h>
#include <gtest/gtest.h>
#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace Rocket {
namespace mqconsumer {
namespace tests {

struct Pair
{
    int64_t _first{0};
    int64_t _second{0};
};

TEST(Snapshot, DefaultValue)
{
    Snapshot<std::vector<int>> snapshot;
    ASSERT_TRUE(snapshot.get()->empty());
}

TEST(Snapshot, SetReturnsPrevious)
{
    Snapshot<std::string> snapshot("first");
    Snapshot<std::string>::Ptr previous = snapshot.set("second");
    ASSERT_EQ("first", *previous);
    ASSERT_EQ("second", *snapshot.get());
}

TEST(Snapshot, ReadersKeepTheirValue)
{
    Snapshot<std::string> snapshot("first");
    Snapshot<std::string>::Ptr reader = snapshot.get();
    snapshot.update([](const std::string& current)->std::string { return current + "+"; });
    ASSERT_EQ("first", *reader);
    ASSERT_EQ("first+", *snapshot.get());
}

TEST(Snapshot, UpdateReturnsNewValue)
{
    Snapshot<int> snapshot(1);
    ASSERT_EQ(2, *snapshot.update([](int current) { return current + 1; }));
    ASSERT_EQ(2, *snapshot.get());
}

TEST(Snapshot, ConcurrentUpdatesAreNotTorn)
{
    Snapshot<Pair> snapshot;
    const int numWriters = 4;
    const int numUpdates = 1000;
    std::atomic_bool torn{false};
    std::atomic_bool done{false};
    
    std::vector<std::thread> readers;
    for (int i = 0; i < 4; ++i) {
        readers.emplace_back([&] {
            while (!done) {
                Snapshot<Pair>::Ptr value = snapshot.get();
                if (value->_first != value->_second) {
                    torn = true;
                }
            }
        });
    }
    std::vector<std::thread> writers;
    for (int i = 0; i < numWriters; ++i) {
        writers.emplace_back([&] {
            for (int j = 0; j < numUpdates; ++j) {
                snapshot.update([](const Pair& current)->Pair {
                    return {current._first + 1, current._second + 1};
                });
            }
        });
    }
    for (auto& writer : writers) {
        writer.join();
    }
    done = true;
    for (auto& reader : readers) {
        reader.join();
    }
    ASSERT_FALSE(torn);
    // updates are serialized so none is lost
    ASSERT_EQ(numWriters * numUpdates, snapshot.get()->_first);
    ASSERT_EQ(numWriters * numUpdates, snapshot.get()->_second);
}

}}}
