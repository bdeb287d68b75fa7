/// @file window.cpp
/// @brief SDL2 window and renderer implementation.

#include "core/window.hpp"

#include <utility>

namespace skydome::core
{

Window::Window(const WindowConfig& config)
    : m_width{config.width}
    , m_height{config.height}
{
    // -----------------------------------------------------------------
    // Tell SDL we manage our own entry point (no SDL_main hijack)
    // -----------------------------------------------------------------
    SDL_SetMainReady();

    // -----------------------------------------------------------------
    // Initialize SDL video subsystem
    // -----------------------------------------------------------------
    if (SDL_Init(SDL_INIT_VIDEO) != 0)
    {
        SKY_CORE_CRITICAL("SDL_Init failed: {}", SDL_GetError());
        m_should_close = true;
        return;
    }
    m_sdl_initialized = true;

    // -----------------------------------------------------------------
    // Assemble window flags
    // -----------------------------------------------------------------
    u32 flags = SDL_WINDOW_SHOWN;

    if (config.resizable)
    {
        flags |= SDL_WINDOW_RESIZABLE;
    }

    if (config.fullscreen)
    {
        flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
    }

    // -----------------------------------------------------------------
    // Create the SDL2 window
    // -----------------------------------------------------------------
    m_window = SDL_CreateWindow(
        config.title.c_str(),
        SDL_WINDOWPOS_CENTERED,
        SDL_WINDOWPOS_CENTERED,
        static_cast<int>(config.width),
        static_cast<int>(config.height),
        flags);

    if (m_window == nullptr)
    {
        SKY_CORE_CRITICAL("SDL_CreateWindow failed: {}", SDL_GetError());
        m_should_close = true;
        return;
    }

    // -----------------------------------------------------------------
    // Create the 2D renderer (accelerated, vsync'd)
    // -----------------------------------------------------------------
    m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
    if (m_renderer == nullptr)
    {
        SKY_CORE_WARN("Accelerated renderer unavailable ({}), falling back to software", SDL_GetError());
        m_renderer = SDL_CreateRenderer(m_window, -1, SDL_RENDERER_SOFTWARE);
    }

    if (m_renderer == nullptr)
    {
        SKY_CORE_CRITICAL("SDL_CreateRenderer failed: {}", SDL_GetError());
        m_should_close = true;
        return;
    }

    SDL_SetRenderDrawBlendMode(m_renderer, SDL_BLENDMODE_BLEND);

    // Fullscreen changes the drawable size
    refresh_size();

    SKY_CORE_INFO("Window created: \"{}\" ({}x{}) [{}{}]",
                  config.title,
                  m_width,
                  m_height,
                  config.resizable ? "resizable" : "fixed",
                  config.fullscreen ? " | fullscreen" : "");
}

Window::~Window()
{
    if (m_renderer != nullptr)
    {
        SDL_DestroyRenderer(m_renderer);
    }

    if (m_window != nullptr)
    {
        SDL_DestroyWindow(m_window);
        SKY_CORE_INFO("Window destroyed");
    }

    if (m_sdl_initialized)
    {
        SDL_Quit();
    }
}

bool Window::should_close() const
{
    return m_should_close;
}

void Window::request_close()
{
    m_should_close = true;
}

void Window::set_event_callback(EventCallback callback)
{
    m_event_callback = std::move(callback);
}

void Window::set_title(const std::string& title)
{
    if (m_window != nullptr)
    {
        SDL_SetWindowTitle(m_window, title.c_str());
    }
}

void Window::poll_events()
{
    SDL_Event event{};
    while (SDL_PollEvent(&event) != 0)
    {
        switch (event.type)
        {
            case SDL_QUIT:
            {
                m_should_close = true;
                break;
            }

            case SDL_WINDOWEVENT:
            {
                switch (event.window.event)
                {
                    case SDL_WINDOWEVENT_CLOSE:
                    {
                        m_should_close = true;
                        break;
                    }

                    case SDL_WINDOWEVENT_SIZE_CHANGED:
                    case SDL_WINDOWEVENT_RESTORED:
                    {
                        refresh_size();
                        m_was_resized = true;
                        SKY_CORE_TRACE("Window resized: {}x{}", m_width, m_height);
                        break;
                    }

                    case SDL_WINDOWEVENT_MINIMIZED:
                    {
                        m_width = 0;
                        m_height = 0;
                        m_was_resized = true;
                        SKY_CORE_TRACE("Window minimized");
                        break;
                    }

                    default:
                        break;
                }
                break;
            }

            default:
                break;
        }

        if (m_event_callback)
        {
            m_event_callback(event);
        }
    }
}

SDL_Window* Window::get_native_handle() const
{
    return m_window;
}

SDL_Renderer* Window::get_renderer() const
{
    return m_renderer;
}

u32 Window::get_width() const
{
    return m_width;
}

u32 Window::get_height() const
{
    return m_height;
}

bool Window::was_resized()
{
    const bool resized = m_was_resized;
    m_was_resized = false;
    return resized;
}

// -----------------------------------------------------------------
// Drawable size in renderer pixels
// -----------------------------------------------------------------

void Window::refresh_size()
{
    int w = 0;
    int h = 0;
    if (m_renderer != nullptr && SDL_GetRendererOutputSize(m_renderer, &w, &h) == 0)
    {
        m_width = static_cast<u32>(w);
        m_height = static_cast<u32>(h);
        return;
    }

    if (m_window != nullptr)
    {
        SDL_GetWindowSize(m_window, &w, &h);
        m_width = static_cast<u32>(w);
        m_height = static_cast<u32>(h);
    }
}

} // namespace skydome::core
