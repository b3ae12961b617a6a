#pragma once
#include <SFML/Graphics.hpp>
#include <imgui.h>
#include <deque>
#include <string>
#include <vector>

#include "MarkovModel.hpp"
#include "PassConfig.hpp"
#include "RandomSource.hpp"
#include "Reporter.hpp"
#include "TypingTitle.hpp"

class App : public Reporter {
public:
    explicit App(const PassConfig& cfg);

    // lifecycle
    void reloadWordList();
    void rebuildModel();

    // actions
    void generate();
    void copyToClipboard();

    // input
    bool onKeyPressed(sf::Keyboard::Key key);

    // logic
    void update(float dt);
    void renderUI();

    // Reporter
    void message(const std::string& text) override;
    void progress(const std::string& stage, size_t done, size_t total) override;

    // expose
    const PassConfig& config() const { return m_cfg; }
    const std::string& password() const { return m_password; }
    bool wantsToQuit() const { return m_wantsToQuit; }

private:
    RandomSource& rng();
    void showMessage(const std::string& text, float seconds, bool error);

    // drawing helpers
    void topMenu();
    void drawPassword();
    void footer();

private:
    PassConfig m_cfg{};
    MarkovModel m_model;
    MersenneSource m_fastRng;
    SystemSource m_secureRng;

    // text fields backing the settings menu
    char m_pathBuf[512] = {0};
    char m_delimBuf[8] = {0};

    // last result
    std::string m_password;
    std::vector<int> m_attempts;

    // status line
    float m_msgTimer = 0.f;
    std::string m_msg;
    bool m_msgIsError = false;

    // activity log, newest last
    std::deque<std::string> m_log;
    size_t m_logLimit = 200;
    std::string m_progressStage;
    float m_progress = 0.f;

    // title typing animation
    TypingTitle m_title{"PASSCLIP"};

    // copied highlight fades out
    float m_copyFlash = 0.f;

    bool m_wantsToQuit = false;
};
