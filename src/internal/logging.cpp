#include <mutex>
#include <unordered_set>
#include <vector>

#include <plog/Init.h>

#include "logging.hpp"

using namespace std;

void hydrator::internal::initLogging(shared_ptr<plog::IAppender> appender)
{
    static mutex registryMutex;
    static unordered_set<plog::IAppender*> registered;

    if (appender == nullptr)
    {
        return;
    }

    lock_guard<mutex> lock(registryMutex);
    if (!registered.insert(appender.get()).second)
    {
        return;
    }

    // plog holds a raw pointer, so the appender must outlive logging.  Keep it alive here.
    static vector<shared_ptr<plog::IAppender>> owned;
    owned.push_back(appender);

    plog::init(plog::debug, appender.get());
};
