#pragma once

/// @file window.hpp
/// @brief SDL2 window with an accelerated 2D renderer.

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <SDL2/SDL.h>

#include <functional>
#include <string>

namespace skydome::core
{
    /// @brief Callback type for receiving raw SDL events from the window.
    using EventCallback = std::function<void(const SDL_Event&)>;

    /// @brief SDL2 window wrapper owning the window and its SDL_Renderer.
    ///
    /// Handles SDL_QUIT, window close, and resize events.
    /// Non-copyable; exactly one window instance should exist.
    /// If SDL fails during construction the failure is logged and the
    /// window starts in the "should close" state.
    class Window
    {
    public:
        /// @brief Create and show an SDL2 window and its renderer.
        /// @param config Window configuration (title, dimensions, flags).
        explicit Window(const WindowConfig& config);

        /// @brief Destroy the renderer and window, then shut down SDL.
        ~Window();

        Window(const Window&) = delete;
        Window& operator=(const Window&) = delete;
        Window(Window&&) = delete;
        Window& operator=(Window&&) = delete;

        /// @brief Returns true if the window has been requested to close.
        [[nodiscard]] bool should_close() const;

        /// @brief Request the window to close (e.g., from Escape key).
        void request_close();

        /// @brief Poll all pending SDL events.
        /// Updates internal state for close requests and resize events.
        /// If an event callback is set, it is called for every event.
        void poll_events();

        /// @brief Set a callback to receive all SDL events during poll_events().
        /// @param callback The callback function, or nullptr to clear.
        void set_event_callback(EventCallback callback);

        /// @brief Replace the window title.
        void set_title(const std::string& title);

        /// @brief Access the underlying SDL_Window pointer.
        [[nodiscard]] SDL_Window* get_native_handle() const;

        /// @brief The 2D renderer bound to this window (nullptr if creation failed).
        [[nodiscard]] SDL_Renderer* get_renderer() const;

        /// @brief Current drawable width in pixels.
        [[nodiscard]] u32 get_width() const;

        /// @brief Current drawable height in pixels.
        [[nodiscard]] u32 get_height() const;

        /// @brief Returns true if the window was resized since the last call.
        /// Resets the flag after reading.
        [[nodiscard]] bool was_resized();

    private:
        void refresh_size();

        SDL_Window* m_window = nullptr;
        SDL_Renderer* m_renderer = nullptr;
        u32 m_width = 0;
        u32 m_height = 0;
        bool m_sdl_initialized = false;
        bool m_should_close = false;
        bool m_was_resized = false;
        EventCallback m_event_callback;
    };

} // namespace skydome::core
