#include "../support/Check.hpp"

#include <castlink/core/TaskQueue.hpp>

#include <atomic>
#include <deque>
#include <thread>
#include <vector>

using castlink::core::TaskQueue;

namespace
{

/// 단일 스레드에서 FIFO 순서가 유지되는지 확인합니다.
void test_single_thread_order()
{
    TaskQueue queue;
    std::vector<int> result;

    for (int i = 0; i < 5; ++i)
        CHECK(queue.push([&result, i] { result.push_back(i); }));
    CHECK(queue.size() == 5);

    TaskQueue::Task task;
    while (queue.tryPop(task))
        task();

    CHECK(result == (std::vector<int>{0, 1, 2, 3, 4}));
    CHECK(queue.size() == 0);
}

/// popAll 은 쌓인 작업을 한 번에 옮기고 순서를 유지합니다.
void test_pop_all_moves_batch()
{
    TaskQueue queue;
    std::vector<int> result;
    for (int i = 0; i < 3; ++i)
        queue.push([&result, i] { result.push_back(i); });

    std::deque<TaskQueue::Task> batch;
    CHECK(queue.popAll(batch) == 3);
    CHECK(queue.size() == 0);
    for (auto &t : batch)
        t();
    CHECK(result == (std::vector<int>{0, 1, 2}));
}

/// close 이후 push 는 거부됩니다.
void test_close_rejects_push()
{
    TaskQueue queue;
    queue.push([] {});
    queue.close();
    CHECK(queue.isClosed());

    bool ran = false;
    CHECK(!queue.push([&ran] { ran = true; }));

    // 닫히기 전에 들어온 작업은 남아 있다.
    TaskQueue::Task task;
    CHECK(queue.tryPop(task));
    CHECK(!queue.tryPop(task));
    CHECK(!ran);
}

/// 여러 producer 가 동시에 넣어도 유실이 없고, producer 별 순서는 유지됩니다.
void test_multi_producer_keeps_per_producer_order()
{
    TaskQueue queue;

    constexpr int kProducers = 4;
    constexpr int kPerProducer = 1000;

    std::vector<std::vector<int>> seen(kProducers);
    std::atomic<bool> producersDone{false};
    std::atomic<int> executed{0};

    std::thread consumer(
        [&]()
        {
            for (;;)
            {
                TaskQueue::Task task;
                if (queue.tryPop(task))
                {
                    task();
                    executed.fetch_add(1, std::memory_order_relaxed);
                    continue;
                }
                if (producersDone.load(std::memory_order_acquire) &&
                    executed.load(std::memory_order_relaxed) >= kProducers * kPerProducer)
                    break;
                std::this_thread::yield();
            }
        });

    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p)
    {
        producers.emplace_back(
            [&, p]()
            {
                for (int i = 0; i < kPerProducer; ++i)
                    queue.push([&seen, p, i] { seen[p].push_back(i); });
            });
    }
    for (auto &t : producers)
        t.join();
    producersDone.store(true, std::memory_order_release);
    consumer.join();

    CHECK(executed.load() == kProducers * kPerProducer);
    for (int p = 0; p < kProducers; ++p)
    {
        CHECK(static_cast<int>(seen[p].size()) == kPerProducer);
        bool ordered = true;
        for (int i = 0; i < static_cast<int>(seen[p].size()); ++i)
            ordered = ordered && seen[p][i] == i;
        CHECK(ordered);
    }
}

} // namespace

int main()
{
    test_single_thread_order();
    test_pop_all_moves_batch();
    test_close_rejects_push();
    test_multi_producer_keeps_per_producer_order();
    return castlink::test::finish("core.task_queue");
}
