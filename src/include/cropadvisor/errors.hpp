/*───────────────────────────────────────────────────────────
 *  errors.hpp   –  error taxonomy + read results
 *
 *  Only DataUnavailable ever leaves the fusion engine; the
 *  other two are raised by backends / model code and turned
 *  into logged, degraded results by their owners.
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace cropadvisor {

class CropAdvisorError : public std::runtime_error {
public:
    explicit CropAdvisorError(const std::string& msg) : std::runtime_error(msg) {}
};

/* upstream gateway / base provider unreachable */
class DataUnavailable : public CropAdvisorError {
public:
    explicit DataUnavailable(const std::string& msg) : CropAdvisorError(msg) {}
};

/* store read/write, model load/save */
class PersistenceFailure : public CropAdvisorError {
public:
    explicit PersistenceFailure(const std::string& msg) : CropAdvisorError(msg) {}
};

/* fewer samples than the training threshold */
class TrainingInsufficientData : public CropAdvisorError {
public:
    TrainingInsufficientData(size_t have, size_t need)
        : CropAdvisorError("insufficient training data: " + std::to_string(have) +
                           " samples (need " + std::to_string(need) + "+)"),
          have_(have), need_(need) {}
    size_t have() const { return have_; }
    size_t need() const { return need_; }
private:
    size_t have_;
    size_t need_;
};

/* ---------- read results: found / no data / failed ---------- */
enum class ReadStatus { Found, NoData, Failed };

inline const char* to_string(ReadStatus s)
{
    switch (s) {
        case ReadStatus::Found:  return "found";
        case ReadStatus::NoData: return "no_data";
        case ReadStatus::Failed: return "failed";
    }
    return "failed";
}

template <typename T>
struct ReadResult {
    ReadStatus status = ReadStatus::NoData;
    T          value{};
    std::string error;            // set when status == Failed

    static ReadResult found(T v)   { ReadResult r; r.status = ReadStatus::Found; r.value = std::move(v); return r; }
    static ReadResult no_data()    { return ReadResult{}; }
    static ReadResult failed(std::string why)
    {
        ReadResult r; r.status = ReadStatus::Failed; r.error = std::move(why); return r;
    }

    bool ok()    const { return status == ReadStatus::Found; }
    explicit operator bool() const { return ok(); }
};

} // namespace cropadvisor
