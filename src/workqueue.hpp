// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <functional>
#include <mutex>
#include <condition_variable>

class WorkQueue
{
public:
	static unsigned int getIdealWorkerCount();

	explicit WorkQueue(size_t workerCount);
	~WorkQueue();

	void push(std::function<void()> fun);

	// Runs fun over [0, count) split into ranges of at most grain items and waits for all of them;
	// the first exception thrown by a range is rethrown here
	void parallelFor(size_t count, size_t grain, const std::function<void (size_t begin, size_t end)>& fun);

	size_t getWorkerCount() const
	{
		return workers.size();
	}

private:
	std::mutex mutex;
	std::condition_variable jobsNotEmpty;
	std::queue<std::function<void()>> jobs;

	std::vector<std::thread> workers;

	std::function<void()> pop();
	void workerThreadFun();
};
