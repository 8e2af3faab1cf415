#include <gtest/gtest.h>
#include "worker_stats.hpp"
#include <algorithm>
#include <thread>

namespace httpload {

using std::chrono::milliseconds;
using std::chrono::nanoseconds;

namespace {

ExecutionResult response(int status, milliseconds latency) {
    ExecutionResult result;
    result.statusCode = status;
    result.success = status >= 200 && status < 300;
    result.latency = latency;
    return result;
}

ExecutionResult transportFailure() {
    ExecutionResult result;
    result.error = "Couldn't connect to server";
    return result;
}

} // namespace

class WorkerStatsTest : public ::testing::Test {
protected:
    WorkerStat makeStat(std::initializer_list<ExecutionResult> results) {
        WorkerStat stat;
        for (const auto& result : results) {
            stat.record(result, milliseconds(1));
        }
        return stat;
    }
};

TEST_F(WorkerStatsTest, RecordSuccess) {
    WorkerStat stat;
    stat.record(response(200, milliseconds(12)), milliseconds(15));

    EXPECT_EQ(stat.totalRequests, 1u);
    EXPECT_EQ(stat.successRequests, 1u);
    EXPECT_EQ(stat.failedRequests, 0u);
    ASSERT_EQ(stat.responseTimes.size(), 1u);
    EXPECT_EQ(stat.responseTimes[0], milliseconds(12));
    EXPECT_EQ(stat.statusCodes.at(200), 1u);
    EXPECT_EQ(stat.totalTime, milliseconds(15));
}

TEST_F(WorkerStatsTest, NonSuccessStatusStillRecordsLatency) {
    WorkerStat stat;
    stat.record(response(503, milliseconds(4)), milliseconds(5));

    EXPECT_EQ(stat.failedRequests, 1u);
    EXPECT_EQ(stat.responseTimes.size(), 1u);
    EXPECT_EQ(stat.statusCodes.at(503), 1u);
}

TEST_F(WorkerStatsTest, TransportFailureHasNoLatencyOrStatus) {
    WorkerStat stat;
    stat.record(transportFailure(), milliseconds(2));

    EXPECT_EQ(stat.totalRequests, 1u);
    EXPECT_EQ(stat.failedRequests, 1u);
    EXPECT_TRUE(stat.responseTimes.empty());
    EXPECT_TRUE(stat.statusCodes.empty());
    EXPECT_EQ(stat.totalTime, milliseconds(2));
}

TEST_F(WorkerStatsTest, CountsStayConsistent) {
    auto stat = makeStat({response(200, milliseconds(1)), response(404, milliseconds(2)),
                          transportFailure(), response(201, milliseconds(3))});

    EXPECT_EQ(stat.totalRequests, stat.successRequests + stat.failedRequests);

    uint64_t statusSum = 0;
    for (const auto& [code, count] : stat.statusCodes) {
        statusSum += count;
    }
    EXPECT_EQ(statusSum, stat.responseTimes.size());
    EXPECT_LE(stat.responseTimes.size(), stat.totalRequests);
}

TEST_F(WorkerStatsTest, AggregateSumsWorkers) {
    std::vector<WorkerStat> stats = {
        makeStat({response(200, milliseconds(5)), response(200, milliseconds(1))}),
        makeStat({response(500, milliseconds(3)), transportFailure()}),
        makeStat({})};

    auto global = aggregate(stats);
    EXPECT_EQ(global.totalRequests, 4u);
    EXPECT_EQ(global.successRequests, 2u);
    EXPECT_EQ(global.failedRequests, 2u);
    EXPECT_EQ(global.statusCodes.at(200), 2u);
    EXPECT_EQ(global.statusCodes.at(500), 1u);
    EXPECT_EQ(global.responseTimes.size(), 3u);
    EXPECT_EQ(global.totalTime, milliseconds(4));

    global.sortLatencies();
    EXPECT_TRUE(std::is_sorted(global.responseTimes.begin(), global.responseTimes.end()));
    EXPECT_EQ(global.responseTimes.front(), milliseconds(1));
    EXPECT_EQ(global.responseTimes.back(), milliseconds(5));
}

TEST_F(WorkerStatsTest, AggregateIsOrderIndependent) {
    std::vector<WorkerStat> stats = {
        makeStat({response(200, milliseconds(7)), response(404, milliseconds(2))}),
        makeStat({response(200, milliseconds(3))}),
        makeStat({transportFailure(), response(302, milliseconds(9))})};

    auto forward = aggregate(stats);
    std::reverse(stats.begin(), stats.end());
    auto backward = aggregate(stats);

    forward.sortLatencies();
    backward.sortLatencies();

    EXPECT_EQ(forward.totalRequests, backward.totalRequests);
    EXPECT_EQ(forward.successRequests, backward.successRequests);
    EXPECT_EQ(forward.failedRequests, backward.failedRequests);
    EXPECT_EQ(forward.statusCodes, backward.statusCodes);
    EXPECT_EQ(forward.responseTimes, backward.responseTimes);
}

TEST_F(WorkerStatsTest, AggregateOfNothingIsZero) {
    auto global = aggregate({});
    EXPECT_EQ(global.totalRequests, 0u);
    EXPECT_TRUE(global.responseTimes.empty());
    EXPECT_TRUE(global.statusCodes.empty());
}

TEST_F(WorkerStatsTest, CollectWhileWorkersRecord) {
    WorkerStatsSlots slots;
    for (int i = 0; i < 4; ++i) {
        slots.push_back(std::make_unique<WorkerStatsSlot>(1000));
    }
    StatsAggregator aggregator(slots);

    std::vector<std::thread> writers;
    for (auto& slot : slots) {
        writers.emplace_back([&slot]() {
            for (int i = 0; i < 1000; ++i) {
                slot->record(response(200, milliseconds(1)), milliseconds(1));
            }
        });
    }

    uint64_t previous = 0;
    for (int i = 0; i < 50; ++i) {
        auto snapshot = aggregator.collect();
        EXPECT_EQ(snapshot.totalRequests,
                  snapshot.successRequests + snapshot.failedRequests);
        EXPECT_GE(snapshot.totalRequests, previous);
        previous = snapshot.totalRequests;
    }

    for (auto& writer : writers) {
        writer.join();
    }

    auto final = aggregator.collect();
    EXPECT_EQ(final.totalRequests, 4000u);
    EXPECT_EQ(final.responseTimes.size(), 4000u);
    EXPECT_EQ(slots[0]->snapshot().totalRequests, 1000u);
}

} // namespace httpload
