#include "scan/repo_scanner.hpp"

#include <algorithm>
#include <condition_variable>
#include <iterator>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "scan/path_normalizer.hpp"

namespace fs = std::filesystem;

namespace sessionizer::scan
{
    namespace
    {

        constexpr const char *kRepositoryMarker = ".git";

        // One directory on the logical path from a root, by its resolved location.
        struct PathFrame
        {
            fs::path canonical;
            std::shared_ptr<const PathFrame> parent;
        };

        struct ScanTask
        {
            fs::path dir;
            std::shared_ptr<const PathFrame> frame;
        };

        // Following a link to a directory we are already inside never terminates.
        bool formsCycle(const fs::path &target, const std::shared_ptr<const PathFrame> &frame)
        {
            for (const PathFrame *it = frame.get(); it != nullptr; it = it->parent.get())
            {
                if (it->canonical == target || isDescendantOf(it->canonical, target))
                {
                    return true;
                }
            }
            return false;
        }

        class ScanWorkerPool
        {
        public:
            ScanWorkerPool(std::size_t workerCount, bool nested, const sessionizer::Context &ctx)
                : nested_(nested), ctx_(ctx), results_(workerCount)
            {
                workers_.reserve(workerCount);
                try
                {
                    for (std::size_t i = 0; i < workerCount; ++i)
                    {
                        workers_.emplace_back([this, i]()
                                              { workerLoop(i); });
                    }
                }
                catch (const std::system_error &)
                {
                    // The destructor does not run for a throwing constructor.
                    shutdown();
                    throw;
                }
            }

            ~ScanWorkerPool()
            {
                shutdown();
            }

            void enqueue(ScanTask task)
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_)
                {
                    return;
                }
                queue_.push(std::move(task));
                ++pending_;
                cv_.notify_one();
            }

            // Blocks until no task is queued or running, then merges every worker's findings.
            std::vector<fs::path> collect()
            {
                {
                    std::unique_lock<std::mutex> lock(mutex_);
                    idle_.wait(lock, [this]()
                               { return pending_ == 0; });
                }
                shutdown();

                std::vector<fs::path> merged;
                for (auto &found : results_)
                {
                    merged.insert(merged.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
                    found.clear();
                }
                return merged;
            }

        private:
            void shutdown()
            {
                {
                    std::lock_guard<std::mutex> lock(mutex_);
                    if (stopping_)
                    {
                        return;
                    }
                    stopping_ = true;
                    cv_.notify_all();
                }

                for (auto &worker : workers_)
                {
                    if (worker.joinable())
                    {
                        worker.join();
                    }
                }
                workers_.clear();
            }

            void workerLoop(std::size_t index)
            {
                for (;;)
                {
                    ScanTask task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        cv_.wait(lock, [this]()
                                 { return stopping_ || !queue_.empty(); });

                        if (stopping_)
                        {
                            return;
                        }

                        task = std::move(queue_.front());
                        queue_.pop();
                    }

                    try
                    {
                        scanDirectory(task, results_[index]);
                    }
                    catch (const std::exception &ex)
                    {
                        ctx_.warn("Skipping ", task.dir.string(), ": ", ex.what());
                    }

                    std::lock_guard<std::mutex> lock(mutex_);
                    if (--pending_ == 0)
                    {
                        idle_.notify_all();
                    }
                }
            }

            void scanDirectory(const ScanTask &task, std::vector<fs::path> &found)
            {
                std::error_code ec;
                fs::directory_iterator it(task.dir, ec);
                if (ec)
                {
                    ctx_.warn("Skipping unreadable directory ", task.dir.string(), ": ", ec.message());
                    return;
                }

                fs::directory_iterator end;
                for (; it != end; it.increment(ec))
                {
                    const fs::directory_entry &entry = *it;
                    std::error_code entryEc;
                    if (!entry.is_directory(entryEc))
                    {
                        continue;
                    }

                    const fs::path child = entry.path();
                    std::shared_ptr<const PathFrame> frame;
                    if (entry.is_symlink(entryEc))
                    {
                        fs::path target = fs::canonical(child, entryEc);
                        if (entryEc)
                        {
                            ctx_.warn("Skipping unresolvable link ", child.string(), ": ", entryEc.message());
                            continue;
                        }
                        if (formsCycle(target, task.frame))
                        {
                            ctx_.debug("Skipping link cycle ", child.string(), " -> ", target.string());
                            continue;
                        }
                        frame = std::make_shared<PathFrame>(PathFrame{std::move(target), task.frame});
                    }
                    else
                    {
                        frame = std::make_shared<PathFrame>(PathFrame{task.frame->canonical / child.filename(), task.frame});
                    }

                    if (isRepository(child))
                    {
                        found.push_back(child);
                        if (!nested_)
                        {
                            continue;
                        }
                    }

                    enqueue(ScanTask{child, std::move(frame)});
                }

                if (ec)
                {
                    ctx_.warn("Stopped reading ", task.dir.string(), ": ", ec.message());
                }
            }

            bool nested_;
            const sessionizer::Context &ctx_;
            std::vector<std::vector<fs::path>> results_; // one slot per worker, merged after join
            std::mutex mutex_;
            std::condition_variable cv_;
            std::condition_variable idle_;
            std::queue<ScanTask> queue_;
            std::vector<std::thread> workers_;
            std::size_t pending_ = 0;
            bool stopping_ = false;
        };

        std::vector<fs::path> runScan(
            const std::vector<fs::path> &roots,
            const ScanOptions &options,
            const sessionizer::Context &ctx,
            bool reportMissing)
        {
            const std::size_t workerCount = options.workers > 0 ? options.workers : defaultWorkerCount();
            ScanWorkerPool pool(workerCount, options.nested, ctx);

            for (const auto &root : roots)
            {
                std::error_code ec;
                if (!fs::exists(root, ec))
                {
                    if (reportMissing)
                    {
                        ctx.warn("Path does not exist: ", root.string());
                    }
                    continue;
                }
                if (!fs::is_directory(root, ec))
                {
                    ctx.debug("Not a directory, skipping: ", root.string());
                    continue;
                }

                fs::path canonical = fs::canonical(root, ec);
                if (ec)
                {
                    canonical = root.lexically_normal();
                }
                ctx.debug("Scanning ", root.string());
                pool.enqueue(ScanTask{root, std::make_shared<PathFrame>(PathFrame{std::move(canonical), nullptr})});
            }

            std::vector<fs::path> found = pool.collect();
            std::sort(found.begin(), found.end());
            found.erase(std::unique(found.begin(), found.end()), found.end());
            return found;
        }

    } // namespace

    std::size_t defaultWorkerCount()
    {
        unsigned int cpu = std::thread::hardware_concurrency();
        if (cpu == 0)
        {
            return 4;
        }
        if (cpu < 2)
        {
            return 2;
        }
        if (cpu > 8)
        {
            return 8;
        }
        return static_cast<std::size_t>(cpu);
    }

    bool isRepository(const fs::path &dir)
    {
        std::error_code ec;
        return fs::exists(dir / kRepositoryMarker, ec);
    }

    std::vector<fs::path> scanRepositories(const fs::path &root, const ScanOptions &options, const sessionizer::Context &ctx)
    {
        return runScan({root}, options, ctx, false);
    }

    std::vector<fs::path> scanRepositories(const std::vector<fs::path> &roots, const ScanOptions &options, const sessionizer::Context &ctx)
    {
        return runScan(roots, options, ctx, true);
    }

} // namespace sessionizer::scan
