#include "parkpool/thread_group.hpp"

namespace parkpool {

void ThreadGroup::joinAll() {
    for (auto& t : threads_)
        if (t.joinable()) t.join();
    threads_.clear();
}

} // namespace parkpool
