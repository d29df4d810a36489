#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <thread>

#include "infra/interrupt.hpp"

using namespace shootsync::infra;
using namespace std::chrono_literals;

namespace {

auto wait_for_stop(const CancellationController& controller) -> bool {
    for (int i = 0; i < 200 && !controller.cancelled(); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    return controller.cancelled();
}

} // namespace

TEST(CancellationTest, TokenStaysClearWithoutSignal)
{
    g_interrupted.store(false);
    CancellationController controller{5ms};
    auto token = controller.token();

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(controller.cancelled());
    EXPECT_FALSE(token.stop_requested());
}

TEST(CancellationTest, SignalIsTranslatedToStopRequest)
{
    install_signal_handler();
    CancellationController controller{5ms};
    ASSERT_FALSE(controller.cancelled());

    std::raise(SIGINT);
    EXPECT_TRUE(is_interrupted());
    EXPECT_TRUE(wait_for_stop(controller));

    g_interrupted.store(false);
}
