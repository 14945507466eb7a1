// This file is part of qfuzz and is distributed under the MIT license, see LICENSE.md
#include "workqueue.hpp"

#include <algorithm>
#include <exception>
#include <memory>

unsigned int WorkQueue::getIdealWorkerCount()
{
	return std::max(std::thread::hardware_concurrency(), 1u);
}

WorkQueue::WorkQueue(size_t workerCount)
{
	for (size_t i = 0; i < std::max<size_t>(workerCount, 1); ++i)
		workers.emplace_back(&WorkQueue::workerThreadFun, this);
}

WorkQueue::~WorkQueue()
{
	// an empty job stops one worker
	for (size_t i = 0; i < workers.size(); ++i)
		push(std::function<void()>());

	for (size_t i = 0; i < workers.size(); ++i)
		workers[i].join();
}

void WorkQueue::push(std::function<void()> fun)
{
	std::unique_lock<std::mutex> lock(mutex);
	jobs.push(std::move(fun));
	lock.unlock();

	jobsNotEmpty.notify_one();
}

std::function<void()> WorkQueue::pop()
{
	std::unique_lock<std::mutex> lock(mutex);
	jobsNotEmpty.wait(lock, [&]() { return !jobs.empty(); });

	std::function<void()> result = std::move(jobs.front());
	jobs.pop();

	return result;
}

void WorkQueue::workerThreadFun()
{
	while (std::function<void()> fun = pop())
		fun();
}

struct WorkGroup
{
	std::mutex mutex;
	std::condition_variable done;

	size_t pending;
	std::exception_ptr error;
};

void WorkQueue::parallelFor(size_t count, size_t grain, const std::function<void (size_t begin, size_t end)>& fun)
{
	if (count == 0) return;

	grain = std::max<size_t>(grain, 1);

	std::shared_ptr<WorkGroup> group = std::make_shared<WorkGroup>();
	group->pending = (count + grain - 1) / grain;

	for (size_t begin = 0; begin < count; begin += grain)
	{
		size_t end = std::min(count, begin + grain);

		push([group, &fun, begin, end]() {
			std::exception_ptr error;

			try
			{
				fun(begin, end);
			}
			catch (...)
			{
				error = std::current_exception();
			}

			std::unique_lock<std::mutex> lock(group->mutex);

			if (error && !group->error)
				group->error = error;

			if (--group->pending == 0)
				group->done.notify_all();
		});
	}

	std::unique_lock<std::mutex> lock(group->mutex);
	group->done.wait(lock, [&]() { return group->pending == 0; });

	if (group->error)
		std::rethrow_exception(group->error);
}
