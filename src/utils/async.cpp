#include "call_engine/utils/async.hpp"

#include <thread>

namespace call_engine::utils {

void run_async(std::function<void()> task) {
    std::thread worker([task = std::move(task)]() mutable {
        task();
    });
    worker.detach();
}

}
