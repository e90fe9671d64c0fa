#pragma once

#include <string>

// One-way HUD notifications. Nothing is returned to the caller.
class ResultPresenter {
public:
    virtual ~ResultPresenter() = default;
    virtual void show_listening() = 0;
    virtual void show_transcribing() = 0;
    virtual void update_transcribing_preview(const std::string& text) = 0;
    virtual void show_success(const std::string& text) = 0;
    virtual void show_error(const std::string& hint) = 0;
    virtual void dismiss() = 0;
};
