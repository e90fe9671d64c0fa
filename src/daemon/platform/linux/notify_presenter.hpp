#pragma once

#include "hint_formatter.hpp"
#include "platform/result_presenter.hpp"
#include "preview_throttle.hpp"

#include <string>
#include <vector>

// HUD on top of notify-send. All notifications share one synchronous slot,
// so each call replaces the previous bubble instead of stacking.
class NotifyPresenter : public ResultPresenter {
public:
    explicit NotifyPresenter(DisplayLanguage language);

    void show_listening() override;
    void show_transcribing() override;
    void update_transcribing_preview(const std::string& text) override;
    void show_success(const std::string& text) override;
    void show_error(const std::string& hint) override;
    void dismiss() override;

private:
    void notify(const std::string& urgency, int timeout_ms,
                const std::string& summary, const std::string& body = {});

    DisplayLanguage language_;
    PreviewThrottle preview_;
};
