#include <chrono>
#include <jettison/jettison.hpp>
#include <thread>
#include <vector>

using namespace jettison;

int main()
{
    // Console output at debug level shows codec failures
    Logger::instance().set_level(LogLevel::Debug);
    Logger::instance().add_sink(sinks::console_sink());

    // Also log to file
    Logger::instance().add_sink(sinks::file_sink("jettison_example.log"));

    JETTISON_LOG_INFO("example", "Logger example starting up");

    JETTISON_LOG_TRACE("example", "This is a trace message");
    JETTISON_LOG_DEBUG("example", "Format version = {}", FORMAT_VERSION);
    JETTISON_LOG_WARN("example", "This is a warning message");

    // A malformed buffer: the codec logs the failure under "codec" and rethrows
    std::vector<uint8_t> garbage = {0x07, 0x02, 0x00, 0x00, 0x00, 0x00};
    try
    {
        decode(garbage);
    }
    catch (const Error& e)
    {
        JETTISON_LOG_ERROR("example", "Caught: {}", e.what());
    }

    // Thread safety
    auto worker = [](int id)
    {
        for (int i = 0; i < 5; ++i)
        {
            auto bytes = encode(Value::integer(id * 100 + i));
            JETTISON_LOG_DEBUG("worker", "Worker {} encoded {} bytes", id, bytes.size());
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    };

    std::thread t1(worker, 1);
    std::thread t2(worker, 2);

    t1.join();
    t2.join();

    JETTISON_LOG_INFO("example", "Logger example completed");

    return 0;
}
