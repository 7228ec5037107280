#include "WellScheduler.hpp"

#include <exception>
#include <mutex>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>

WellRunSummary WellScheduler::run(const std::vector<Well>& wells, int threads, const std::atomic<bool>& cancelled,
                                  const std::function<void(const Well&)>& fn, RunLog* log, const std::string& stage)
{
    WellRunSummary summary;
    std::mutex summaryMutex;
    std::exception_ptr fatalError;
    std::atomic<unsigned long long> finished(0);

    //generate a pool of threads
    boost::asio::thread_pool pool(threads < 1 ? 1 : threads);
    for(const Well& well : wells)
    {
        if(cancelled.load())
        {
            std::lock_guard<std::mutex> guard(summaryMutex);
            summary.skipped.push_back(well);
            continue;
        }

        boost::asio::post(pool, [&, well]()
        {
            //tasks still queued when the run is cancelled do not start
            if(cancelled.load())
            {
                std::lock_guard<std::mutex> guard(summaryMutex);
                summary.skipped.push_back(well);
                return;
            }

            try
            {
                fn(well);
                std::lock_guard<std::mutex> guard(summaryMutex);
                ++summary.completed;
            }
            catch(const FatalInputError&)
            {
                std::lock_guard<std::mutex> guard(summaryMutex);
                if(!fatalError){fatalError = std::current_exception();}
            }
            catch(const std::exception& e)
            {
                if(log != nullptr){log->error(stage, "well " + well.code() + " failed: " + e.what());}
                std::lock_guard<std::mutex> guard(summaryMutex);
                summary.failures.push_back(WellFailure{well, e.what()});
            }

            unsigned long long done = ++finished;
            if(log != nullptr){log->progress(done, wells.size());}
        });
    }
    pool.join();

    if(fatalError)
    {
        std::rethrow_exception(fatalError);
    }

    //failures and skipped wells in well order, independent of thread timing
    std::sort(summary.failures.begin(), summary.failures.end(),
              [](const WellFailure& a, const WellFailure& b){ return a.well < b.well; });
    std::sort(summary.skipped.begin(), summary.skipped.end());
    return summary;
}
