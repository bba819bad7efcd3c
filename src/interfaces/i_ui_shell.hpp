#pragma once

namespace statisfy {

// UI runtime that presents the application and drives the run loop
class IUiShell {
public:
    virtual ~IUiShell() = default;

    // Presents the UI and blocks until it is closed
    virtual void run() = 0;

    // Thread-safe; asks the shell to bring itself to the user's attention
    virtual void request_focus() = 0;
};

} // namespace statisfy
