#pragma once
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "SeatConfig.hpp"
#include "llm_backend.hpp"
#include "synth/SynthEvents.hpp"
#include "synth/SynthTypes.hpp"

namespace chatty {

// Result slot owned by exactly one helper task.
struct HelperSlot {
    HelperSeat seat;
    std::optional<std::string> output;
};

/**
 * Fans one prompt out to every helper seat at once and waits for all of them.
 *
 * A failing or blank seat only empties its own slot; siblings keep running
 * and their output is kept. Slots come back in kHelperSeats order no matter
 * which call finished first.
 */
class HelperDispatcher {
public:
    explicit HelperDispatcher(std::shared_ptr<ILlmBackend> backend);

    std::vector<HelperSlot> dispatch(const std::string& prompt,
                                     const SeatTable& seats,
                                     ISynthEventSink& events);

    // Successful slots in declaration order. Throws AllHelpersFailed if none.
    static std::vector<HelperResult> aggregate(const std::vector<HelperSlot>& slots);

private:
    std::shared_ptr<ILlmBackend> backend_;

    std::optional<std::string> run_helper(HelperSeat seat,
                                          const std::string& model,
                                          const std::string& prompt,
                                          ISynthEventSink& events);
};

}
