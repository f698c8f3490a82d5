// =================================================================
// include/Switchboard/AsyncLineReader.hpp
// =================================================================
// Line input that can be polled without blocking the caller.

#pragma once

#include <chrono>
#include <condition_variable>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace Switchboard {

/**
 * @brief Reads lines from a stream on a background thread
 *
 * The ask command uses it for the operator prompt so that its deadline keeps
 * running while nobody types. A read that is still blocked when the reader
 * is destroyed is left behind; the stream must outlive it.
 */
class AsyncLineReader {
public:
    explicit AsyncLineReader(std::istream& input);

    AsyncLineReader(const AsyncLineReader&) = delete;
    AsyncLineReader& operator=(const AsyncLineReader&) = delete;

    /**
     * @brief Start reading one line unless a read is already in flight
     * @return False if the stream already hit end of input
     */
    bool request();

    /**
     * @brief Wait up to timeout for the requested line
     * @return The line once read (empty at end of input), nullopt while still waiting
     */
    std::optional<std::string> poll(std::chrono::milliseconds timeout);

    bool isReading() const;

private:
    struct State {
        std::mutex mutex;
        std::condition_variable cv;
        bool reading = false;
        bool eof = false;
        std::optional<std::string> line;
    };

    std::istream& m_input;
    std::shared_ptr<State> m_state;
};

} // namespace Switchboard
