#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <imgui-SFML.h>
#include "App.hpp"
#include "PassConfig.hpp"

int main(int argc, char** argv) {
    PassConfig cfg;
    if (argc > 1) cfg.wordlistPath = argv[1];

    sf::RenderWindow window(sf::VideoMode(900, 600), "passclip");
    window.setFramerateLimit(60);
    ImGui::SFML::Init(window);

    ImGuiStyle& style = ImGui::GetStyle();
    style.FrameRounding = 8.f;
    style.ScrollbarRounding = 8.f;
    style.WindowRounding = 8.f;

    App app(cfg);

    sf::Clock deltaClock;
    bool wantQuit = false;

    while (window.isOpen() && !wantQuit) {
        sf::Event event{};
        while (window.pollEvent(event)) {
            ImGui::SFML::ProcessEvent(event);
            if (event.type == sf::Event::Closed) window.close();
            if (event.type == sf::Event::KeyPressed && !ImGui::GetIO().WantTextInput) {
                if (event.key.code == sf::Keyboard::Escape) wantQuit = true;
                app.onKeyPressed(event.key.code);
            }
        }

        float dt = deltaClock.restart().asSeconds();
        ImGui::SFML::Update(window, sf::seconds(dt));
        app.update(dt);

        if (app.wantsToQuit()) {
            wantQuit = true;
        }

        window.clear(sf::Color(20, 20, 26));
        app.renderUI();
        ImGui::SFML::Render(window);
        window.display();
    }

    ImGui::SFML::Shutdown();
    return 0;
}
