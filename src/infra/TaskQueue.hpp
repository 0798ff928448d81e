#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_map>
#include <vector>

namespace PlanningPoker {

	// Fixed worker pool. Tasks enqueued under the same key run one at a time in
	// submission order; tasks under different keys run in parallel.
	class TaskQueue {
	public:
		explicit TaskQueue(size_t numWorkers = std::thread::hardware_concurrency());
		~TaskQueue();

		TaskQueue(const TaskQueue&) = delete;
		TaskQueue& operator=(const TaskQueue&) = delete;

		// Tasks enqueued after shutdown() are dropped.
		void enqueue(std::function<void()> task);
		void enqueue(uint64_t key, std::function<void()> task);

		// Runs every queued task, then joins the workers. Idempotent.
		void shutdown();

		size_t workerCount() const { return workers.size(); }

	private:
		std::vector<std::thread> workers;
		std::queue<std::function<void()>> tasks;
		std::unordered_map<uint64_t, std::deque<std::function<void()>>> lanes;

		std::mutex queueMutex;
		std::condition_variable cv;

		bool stop;
		void workerLoop();
		void drainLane(uint64_t key);
		static void runGuarded(const std::function<void()>& task);
	};

}
