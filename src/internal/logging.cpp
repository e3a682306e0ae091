#include <algorithm>
#include <mutex>
#include <vector>

#include "logging.hpp"

using namespace std;

namespace nip98
{
namespace internal
{
void initLogging(shared_ptr<plog::IAppender> appender)
{
    static mutex initMutex;
    static vector<shared_ptr<plog::IAppender>> retainedAppenders;

    if (appender == nullptr)
    {
        return;
    }

    lock_guard<mutex> lock(initMutex);
    if (find(retainedAppenders.begin(), retainedAppenders.end(), appender) != retainedAppenders.end())
    {
        return;
    }

    retainedAppenders.push_back(appender);
    plog::init(plog::debug, appender.get());
};
} // namespace internal
} // namespace nip98
