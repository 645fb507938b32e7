#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include "ReverseBlockReader.hpp"

// Exposes a ReverseBlockReader to a pull-based transport. Every pull resumes
// exactly one reader step, so the transport regains control after at most
// one block read and can observe a disconnect before the next one.
class LineStreamAdapter {
public:
    enum class Outcome { Pending, Completed, Cancelled, Failed };

    static constexpr size_t kPrimeSteps = 4;

    explicit LineStreamAdapter(std::unique_ptr<ReverseBlockReader> reader);

    // Runs up to maxSteps steps ahead of the first pull, stopping early once
    // some text is produced. Exceptions propagate so the caller can still
    // answer with a status code.
    void prime(size_t maxSteps = kPrimeSteps);

    // Hands over text held back by prime(), or else runs one reader step,
    // appending whatever it produced to out (possibly nothing). Returns false
    // once the stream is over; out may still carry the final text. A failure
    // is logged, recorded and reported to the abort handler; it is never
    // rethrown because the transport has already committed its headers.
    bool pull(std::string& out);

    // Consumer went away. Closes the file; later pulls return false.
    void cancel();

    void setAbortHandler(std::function<void(const std::string&)> handler) { onAbort_ = std::move(handler); }
    void setFinishHandler(std::function<void(Outcome)> handler) { onFinish_ = std::move(handler); }

    Outcome outcome() const { return outcome_; }
    const std::string& errorMessage() const { return error_; }
    uint64_t bytesDelivered() const { return bytesDelivered_; }
    uint64_t stepsRun() const { return stepsRun_; }
    const ReverseBlockReader& reader() const { return *reader_; }

private:
    void complete(Outcome outcome);

    std::unique_ptr<ReverseBlockReader> reader_;
    std::string primed_;
    uint64_t bytesDelivered_ = 0;
    uint64_t stepsRun_ = 0;
    Outcome outcome_ = Outcome::Pending;
    std::string error_;
    std::function<void(const std::string&)> onAbort_;
    std::function<void(Outcome)> onFinish_;
};
