#ifndef PROXFUSION_EXECUTION_H
#define PROXFUSION_EXECUTION_H

#include <thread>

/**
 * @brief Confinement-thread checks
 *
 * The fusion core has no locks: every public call and every sensor callback
 * must arrive on one thread. Components call assertIsMainThread() at the top
 * of each method; a call from any other thread is a programming error.
 */
class Execution {
public:
    virtual ~Execution() = default;

    /**
     * @brief Fault if the caller is not on the confinement thread
     */
    virtual void assertIsMainThread() = 0;

    /**
     * @brief Check without faulting
     */
    virtual bool isMainThread() const = 0;
};

/**
 * @brief Execution bound to the thread that constructed it
 *
 * A violation is logged at ERROR and the process is aborted.
 */
class MainThreadExecution : public Execution {
public:
    MainThreadExecution();

    void assertIsMainThread() override;
    bool isMainThread() const override;

private:
    std::thread::id m_mainThreadId;
};

#endif // PROXFUSION_EXECUTION_H
