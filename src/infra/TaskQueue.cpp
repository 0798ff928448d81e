#include "TaskQueue.hpp"
#include "Logger.hpp"

#include <exception>

namespace PlanningPoker {

	TaskQueue::TaskQueue(size_t numWorkers)
		: stop(false) {

		size_t threadsToCreate = numWorkers > 0 ? numWorkers : 1;

		for (size_t i = 0; i < threadsToCreate; ++i) {
			workers.emplace_back(&TaskQueue::workerLoop, this);
		}

	}

	TaskQueue::~TaskQueue() {
		shutdown();
	}

	void TaskQueue::shutdown() {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			stop = true;
		}
		cv.notify_all();
		for (auto& worker : workers) {
			if (worker.joinable()) {
				worker.join();
			}
		}
	}

	void TaskQueue::enqueue(std::function<void()> task) {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			if (stop) return;
			tasks.push(std::move(task));
		}
		cv.notify_one();
	}

	void TaskQueue::enqueue(uint64_t key, std::function<void()> task) {
		{
			std::unique_lock<std::mutex> lock(queueMutex);
			if (stop) return;
			auto& lane = lanes[key];
			lane.push_back(std::move(task));

			// A lane already holding work has a runner scheduled.
			if (lane.size() > 1) return;

			tasks.push([this, key]() { drainLane(key); });
		}
		cv.notify_one();
	}

	void TaskQueue::drainLane(uint64_t key) {
		while (true) {
			std::function<void()> task;
			{
				std::unique_lock<std::mutex> lock(queueMutex);
				auto it = lanes.find(key);
				if (it == lanes.end() || it->second.empty()) {
					return;
				}
				// Leave the moved-from slot in place so concurrent enqueues see a busy lane.
				task = std::move(it->second.front());
			}

			runGuarded(task);

			{
				std::unique_lock<std::mutex> lock(queueMutex);
				auto it = lanes.find(key);
				it->second.pop_front();
				if (it->second.empty()) {
					lanes.erase(it);
					return;
				}
			}
		}
	}

	void TaskQueue::workerLoop() {
		while (true) {
			std::function<void()> task;
			{
				std::unique_lock<std::mutex> lock(queueMutex);
				cv.wait(lock, [this]() { return stop || !tasks.empty(); });
				if (stop && tasks.empty()) {
					return;
				}
				task = std::move(tasks.front());
				tasks.pop();
			}
			runGuarded(task);
		}
	}

	void TaskQueue::runGuarded(const std::function<void()>& task) {
		try {
			task();
		}
		catch (const std::exception& e) {
			Logger::error(std::string("[TaskQueue] Exception in task: ") + e.what());
		}
		catch (...) {
			Logger::error("[TaskQueue] Unknown exception in task");
		}
	}
}
