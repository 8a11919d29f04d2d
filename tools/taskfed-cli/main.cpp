#include <taskfed/cli/taskfed_cli.h>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <spdlog/spdlog.h>

#include <thread>

int main(int argc, char* argv[]) {
    try {
        spdlog::set_level(spdlog::level::warn);

        // One worker: federated storage bookkeeping is not locked
        boost::asio::io_context io_context;
        auto work_guard = boost::asio::make_work_guard(io_context);
        std::thread worker([&io_context]() { io_context.run(); });

        // Outlives the worker: nothing queued on io_context runs after cli is gone
        taskfed::cli::TaskfedCLI cli(io_context.get_executor());
        int result = cli.run(argc, argv);

        work_guard.reset();
        io_context.stop();
        if (worker.joinable()) {
            worker.join();
        }
        return result;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
