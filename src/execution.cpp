#include "execution.h"
#include "logger.h"
#include <stdlib.h>

MainThreadExecution::MainThreadExecution()
    : m_mainThreadId(std::this_thread::get_id())
{
}

void MainThreadExecution::assertIsMainThread() {
    if (isMainThread()) {
        return;
    }

    LOG_ERROR("Execution: called off the main thread");
    g_logger.flush();
    abort();
}

bool MainThreadExecution::isMainThread() const {
    return std::this_thread::get_id() == m_mainThreadId;
}
