#include "synth/HelperDispatcher.hpp"
#include <chrono>
#include <future>
#include "SystemMonitor.hpp"
#include "synth/Calibration.hpp"
#include "synth/SynthErrors.hpp"
#include "text_utils.hpp"

namespace chatty {

HelperDispatcher::HelperDispatcher(std::shared_ptr<ILlmBackend> backend)
    : backend_(std::move(backend)) {}

std::optional<std::string> HelperDispatcher::run_helper(HelperSeat seat,
                                                        const std::string& model,
                                                        const std::string& prompt,
                                                        ISynthEventSink& events) {
    const std::string seat_name = to_string(seat);
    auto start = std::chrono::high_resolution_clock::now();
    auto elapsed_ms = [&start]() {
        return std::chrono::duration<double, std::milli>(
            std::chrono::high_resolution_clock::now() - start).count();
    };

    try {
        std::string output = trim(backend_->generate(model, apply_calibration(seat_name, prompt)));
        if (output.empty()) {
            SystemMonitor::global_helper_failures.fetch_add(1);
            events.emit({kHelperFailedPhase, seat_name, "empty output from " + model, elapsed_ms()});
            return std::nullopt;
        }
        events.emit({kHelperOkPhase, seat_name, utf8_safe_substr(output, 120), elapsed_ms()});
        return output;
    } catch (const std::exception& e) {
        SystemMonitor::global_helper_failures.fetch_add(1);
        events.emit({kHelperFailedPhase, seat_name, e.what(), elapsed_ms()});
        return std::nullopt;
    }
}

std::vector<HelperSlot> HelperDispatcher::dispatch(const std::string& prompt,
                                                   const SeatTable& seats,
                                                   ISynthEventSink& events) {
    std::vector<std::future<std::optional<std::string>>> pending;
    pending.reserve(kHelperSeats.size());

    for (HelperSeat seat : kHelperSeats) {
        std::string model = seats.model_for(to_string(seat));
        pending.push_back(std::async(std::launch::async,
            [this, seat, model, &prompt, &events]() {
                return run_helper(seat, model, prompt, events);
            }));
    }

    // Barrier: every future is collected before anything is returned.
    std::vector<HelperSlot> slots;
    slots.reserve(pending.size());
    for (size_t i = 0; i < pending.size(); ++i) {
        slots.push_back({kHelperSeats[i], pending[i].get()});
    }
    return slots;
}

std::vector<HelperResult> HelperDispatcher::aggregate(const std::vector<HelperSlot>& slots) {
    std::vector<HelperResult> results;
    for (HelperSeat seat : kHelperSeats) {
        for (const auto& slot : slots) {
            if (slot.seat == seat && slot.output) {
                results.push_back({seat, *slot.output});
                break;
            }
        }
    }
    if (results.empty()) throw AllHelpersFailed();
    return results;
}

}
