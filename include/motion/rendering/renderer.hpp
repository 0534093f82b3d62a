/**
 * @file renderer.hpp
 * @brief Draws layers at their presentation values using SFML
 *
 * This system handles:
 * - Window creation and frame presentation
 * - Square layers drawn at their PresentationValue<Position>
 * - Status text (title, instructions, motion state, FPS)
 */

#ifndef MOTION_RENDERER_HPP
#define MOTION_RENDERER_HPP

#include <string>

#include <entt/entt.hpp>
#include <SFML/Graphics.hpp>

class Renderer {
public:
    /**
     * @brief Constructs renderer with specified screen dimensions
     * @param screenWidth Width of render window in pixels
     * @param screenHeight Height of render window in pixels
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Opens the SFML window and loads the UI font
     * @return true if the window is open. A missing font only disables text.
     */
    bool init();

    /** @brief Clears screen to the background color */
    void clear();

    /** @brief Presents rendered frame to screen */
    void present();

    /**
     * @brief Draws every layer with a presentation position, shape and color
     */
    void renderLayers(const entt::registry& registry);

    /**
     * @brief Renders text at a given position. No-op without a font.
     */
    void renderText(const std::string& text, int x, int y,
                    sf::Color color = sf::Color::White, unsigned int size = 16);

    /** @brief Renders FPS counter in the top-right corner */
    void renderFPS(float fps);

    sf::RenderWindow& getWindow() { return window; }
    bool isWindowOpen() const { return window.isOpen(); }

    int getWidth() const { return screenWidth; }
    int getHeight() const { return screenHeight; }

private:
    sf::RenderWindow window;
    sf::Font font;
    bool fontLoaded;
    int screenWidth;
    int screenHeight;
};

#endif // MOTION_RENDERER_HPP
