#include <mqconsumer_tests_utils.h>
#include <gtest/gtest.h>
#include <set>

namespace Rocket {
namespace mqconsumer {
namespace tests {

const std::vector<std::string> clients{"client-0", "client-1", "client-2"};

std::vector<int> queueIds(const MessageQueueList& queues)
{
    std::vector<int> ids;
    for (const auto& queue : queues) {
        ids.push_back(queue._queueId);
    }
    return ids;
}

//=========================================================================
//                          AVERAGELY
//=========================================================================
TEST(AllocateByAveragely, Name)
{
    ASSERT_STREQ("averagely", allocateByAveragely()->name());
    ASSERT_EQ(allocateByAveragely(), allocateByAveragely());
}

TEST(AllocateByAveragely, ContiguousBlocks)
{
    MessageQueueList queues = makeQueues("topic", 8);
    AllocateStrategy::Ptr strategy = allocateByAveragely();
    ASSERT_EQ(std::vector<int>({0, 1, 2}), queueIds(strategy->allocate("group", "client-0", queues, clients)));
    ASSERT_EQ(std::vector<int>({3, 4, 5}), queueIds(strategy->allocate("group", "client-1", queues, clients)));
    ASSERT_EQ(std::vector<int>({6, 7}), queueIds(strategy->allocate("group", "client-2", queues, clients)));
}

TEST(AllocateByAveragely, FewerQueuesThanClients)
{
    MessageQueueList queues = makeQueues("topic", 2);
    AllocateStrategy::Ptr strategy = allocateByAveragely();
    ASSERT_EQ(std::vector<int>({0}), queueIds(strategy->allocate("group", "client-0", queues, clients)));
    ASSERT_EQ(std::vector<int>({1}), queueIds(strategy->allocate("group", "client-1", queues, clients)));
    ASSERT_TRUE(strategy->allocate("group", "client-2", queues, clients).empty());
}

TEST(AllocateByAveragely, EveryQueueAssignedExactlyOnce)
{
    MessageQueueList queues = makeQueues("topic", 17);
    std::multiset<int> assigned;
    for (const auto& client : clients) {
        for (int id : queueIds(allocateByAveragely()->allocate("group", client, queues, clients))) {
            assigned.insert(id);
        }
    }
    ASSERT_EQ(17u, assigned.size());
    for (int i = 0; i < 17; ++i) {
        ASSERT_EQ(1u, assigned.count(i));
    }
}

TEST(AllocateByAveragely, InvalidInputs)
{
    MessageQueueList queues = makeQueues("topic", 4);
    AllocateStrategy::Ptr strategy = allocateByAveragely();
    ASSERT_TRUE(strategy->allocate("group", "unknown", queues, clients).empty());
    ASSERT_TRUE(strategy->allocate("group", "", queues, clients).empty());
    ASSERT_TRUE(strategy->allocate("group", "client-0", {}, clients).empty());
    ASSERT_TRUE(strategy->allocate("group", "client-0", queues, {}).empty());
}

//=========================================================================
//                          AVERAGELY CIRCLE
//=========================================================================
TEST(AllocateByAveragelyCircle, RoundRobin)
{
    MessageQueueList queues = makeQueues("topic", 8);
    AllocateStrategy::Ptr strategy = allocateByAveragelyCircle();
    ASSERT_STREQ("averagely.circle", strategy->name());
    ASSERT_EQ(std::vector<int>({0, 3, 6}), queueIds(strategy->allocate("group", "client-0", queues, clients)));
    ASSERT_EQ(std::vector<int>({1, 4, 7}), queueIds(strategy->allocate("group", "client-1", queues, clients)));
    ASSERT_EQ(std::vector<int>({2, 5}), queueIds(strategy->allocate("group", "client-2", queues, clients)));
}

TEST(AllocateByAveragelyCircle, UnknownClient)
{
    ASSERT_TRUE(allocateByAveragelyCircle()->allocate("group", "unknown", makeQueues("topic", 4), clients).empty());
}

//=========================================================================
//                          CONFIG
//=========================================================================
TEST(AllocateByConfig, ReturnsFixedList)
{
    MessageQueueList fixed{makeQueue("topic", 3), makeQueue("topic", 5)};
    AllocateStrategy::Ptr strategy = allocateByConfig(fixed);
    ASSERT_STREQ("config", strategy->name());
    ASSERT_EQ(fixed, strategy->allocate("group", "client-0", makeQueues("topic", 8), clients));
}

}}}
