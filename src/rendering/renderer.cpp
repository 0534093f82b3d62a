#include "motion/rendering/renderer.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>

#include "motion/components/layer.hpp"
#include "motion/core/profile.hpp"
#include "motion/math/vector_math.hpp"

Renderer::Renderer(int screenWidth, int screenHeight)
    : window()
    , font()
    , fontLoaded(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() {}

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Spring Motion");
    if (!window.isOpen()) {
        std::cerr << "Failed to create render window\n";
        return false;
    }
    window.setVerticalSyncEnabled(true);

    // Text is optional: the demo still runs without a font
    if (!font.loadFromFile("assets/fonts/arial.ttf")) {
        std::cerr << "Failed to load font assets/fonts/arial.ttf, text disabled\n";
    } else {
        fontLoaded = true;
    }
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(0xfa, 0xfa, 0xfa));
}

void Renderer::present() {
    window.display();
}

void Renderer::renderLayers(const entt::registry& registry) {
    PROFILE_SCOPE("Renderer::renderLayers");

    auto view = registry.view<Components::PresentationValue<Position>,
                              Components::Shape,
                              Components::Color>();
    for (auto entity : view) {
        const auto& pos = view.get<Components::PresentationValue<Position>>(entity).value;
        const auto& shape = view.get<Components::Shape>(entity);
        const auto& color = view.get<Components::Color>(entity);

        float const side = static_cast<float>(shape.halfSize * 2.0);
        sf::RectangleShape square(sf::Vector2f(side, side));
        square.setOrigin(side / 2.f, side / 2.f);
        square.setPosition(static_cast<float>(pos.x), static_cast<float>(pos.y));
        square.setFillColor(sf::Color(color.r, color.g, color.b));
        window.draw(square);
    }
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color, unsigned int size) {
    if (!fontLoaded) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}

void Renderer::renderFPS(float fps) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1) << fps << " FPS";
    renderText(ss.str(), screenWidth - 90, 10, sf::Color(120, 120, 120), 14);
}
