#include "App.hpp"
#include "Errors.hpp"
#include "PasswordShape.hpp"
#include <imgui-SFML.h>
#include <imgui.h>
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <ctime>

namespace {
    ImVec4 colBg        = ImVec4(0.08f, 0.08f, 0.10f, 1.0f);
    ImVec4 colPanel     = ImVec4(0.12f, 0.12f, 0.14f, 1.0f);
    ImVec4 colTitle     = ImVec4(0.8f, 0.8f, 1.0f, 1.0f);
    ImVec4 colPassword  = ImVec4(0.96f, 0.97f, 1.0f, 1.0f);
    ImVec4 colCopied    = ImVec4(0.40f, 0.85f, 0.45f, 1.0f);
    ImVec4 colOk        = ImVec4(0.6f, 1.0f, 0.6f, 1.0f);
    ImVec4 colError     = ImVec4(1.0f, 0.6f, 0.6f, 1.0f);

    std::string timestamp() {
        char buf[16];
        std::time_t now = std::time(nullptr);
        std::strftime(buf, sizeof(buf), "%H:%M:%S", std::localtime(&now));
        return buf;
    }
}

App::App(const PassConfig& cfg) : m_cfg(cfg), m_model(cfg.order) {
    std::snprintf(m_pathBuf, sizeof(m_pathBuf), "%s", m_cfg.wordlistPath.c_str());
    std::snprintf(m_delimBuf, sizeof(m_delimBuf), "%s", m_cfg.delimiter.c_str());
    reloadWordList();
}

RandomSource& App::rng() {
    if (m_cfg.secureRandom) return m_secureRng;
    return m_fastRng;
}

void App::showMessage(const std::string& text, float seconds, bool error) {
    m_msg = text; m_msgTimer = seconds; m_msgIsError = error;
}

void App::message(const std::string& text) {
    m_log.push_back(timestamp() + "  " + text);
    while (m_log.size() > m_logLimit) m_log.pop_front();
    showMessage(text, 2.0f, false);
}

void App::progress(const std::string& stage, size_t done, size_t total) {
    m_progressStage = stage;
    m_progress = total ? (float)done / (float)total : 1.f;
}

void App::reloadWordList() {
    m_cfg.wordlistPath = m_pathBuf;
    m_password.clear(); m_attempts.clear();
    try {
        m_model.loadWordList(m_cfg.wordlistPath, *this);
        rebuildModel();
    } catch (const PassclipError& e) {
        message(std::string("error: ") + e.what());
        showMessage(e.what(), 5.0f, true);
    }
}

void App::rebuildModel() {
    m_model.setOrder(m_cfg.order);
    if (!m_model.hasWords()) return;
    try {
        m_model.build(*this);
    } catch (const PassclipError& e) {
        message(std::string("error: ") + e.what());
        showMessage(e.what(), 5.0f, true);
    }
}

void App::generate() {
    m_cfg.delimiter = m_delimBuf;
    try {
        PasswordResult res = composePassword(m_model, m_cfg, rng());
        m_attempts = res.attempts;
        if (!res.ok()) {
            m_password.clear();
            showMessage("Failed to generate a non-dictionary word for section "
                        + std::to_string(res.failedSection + 1) + " after "
                        + std::to_string(m_cfg.maxAttempts) + " attempts", 4.0f, true);
            return;
        }
        m_password = res.password;
        if (m_cfg.autoCopy) copyToClipboard();
    } catch (const PassclipError& e) {
        m_password.clear();
        showMessage(e.what(), 5.0f, true);
    }
}

void App::copyToClipboard() {
    if (m_password.empty()) {
        showMessage("Nothing to copy yet", 1.5f, true);
        return;
    }
    sf::Clipboard::setString(m_password);
    m_copyFlash = 1.f;
    showMessage("Copied to clipboard", 1.5f, false);
}

bool App::onKeyPressed(sf::Keyboard::Key key) {
    if (key == sf::Keyboard::Enter || key == sf::Keyboard::Space) {
        generate();
        return true;
    }
    if (key == sf::Keyboard::C && sf::Keyboard::isKeyPressed(sf::Keyboard::LControl)) {
        copyToClipboard();
        return true;
    }
    return false;
}

void App::update(float dt) {
    if (m_msgTimer > 0.f) { m_msgTimer -= dt; if (m_msgTimer < 0.f) m_msgTimer = 0.f; }
    if (m_copyFlash > 0.f) m_copyFlash = std::max(0.f, m_copyFlash - dt * 1.5f);

    m_title.update(dt);
}

void App::drawPassword() {
    ImVec2 windowSize = ImGui::GetWindowSize();

    std::string title = m_title.visible();
    ImGui::SetWindowFontScale(2.5f);
    ImGui::SetCursorPosX((windowSize.x - ImGui::CalcTextSize(m_title.text().c_str()).x) * 0.5f);
    ImGui::PushStyleColor(ImGuiCol_Text, colTitle);
    ImGui::Text("%s", title.c_str());
    ImGui::PopStyleColor();
    ImGui::SetWindowFontScale(1.0f);
    ImGui::Dummy(ImVec2(0, 30));

    const char* shown = m_password.empty() ? "press generate" : m_password.c_str();
    ImGui::SetWindowFontScale(2.0f);
    float textW = ImGui::CalcTextSize(shown).x;
    ImGui::SetCursorPosX(std::max(10.f, (windowSize.x - textW) * 0.5f));
    ImVec4 col = colPassword;
    if (m_copyFlash > 0.f) {
        float a = m_copyFlash;
        col = ImVec4(col.x + (colCopied.x-col.x)*a, col.y + (colCopied.y-col.y)*a,
                     col.z + (colCopied.z-col.z)*a, 1.0f);
    }
    if (m_password.empty()) ImGui::TextDisabled("%s", shown);
    else {
        ImGui::PushStyleColor(ImGuiCol_Text, col);
        ImGui::Text("%s", shown);
        ImGui::PopStyleColor();
    }
    ImGui::SetWindowFontScale(1.0f);
    ImGui::Dummy(ImVec2(0, 20));

    float buttonW = 140.f, gap = 12.f;
    ImGui::SetCursorPosX((windowSize.x - (2 * buttonW + gap)) * 0.5f);
    ImGui::PushStyleVar(ImGuiStyleVar_FrameRounding, 8.f);
    if (ImGui::Button("generate", ImVec2(buttonW, 44.f))) generate();
    ImGui::SameLine(0, gap);
    if (ImGui::Button("copy", ImVec2(buttonW, 44.f))) copyToClipboard();
    ImGui::PopStyleVar();

    if (!m_attempts.empty()) {
        std::string att;
        for (size_t i=0;i<m_attempts.size();++i) {
            if (i) att += " / ";
            att += std::to_string(m_attempts[i]);
        }
        ImGui::Dummy(ImVec2(0, 6));
        std::string line = "attempts per section: " + att;
        ImGui::SetCursorPosX((windowSize.x - ImGui::CalcTextSize(line.c_str()).x) * 0.5f);
        ImGui::TextDisabled("%s", line.c_str());
    }
}

void App::topMenu() {
    if (ImGui::BeginMainMenuBar()) {
        if (ImGui::BeginMenu("passclip")) {
            if (ImGui::MenuItem("generate", "Enter")) generate();
            if (ImGui::MenuItem("copy", "Ctrl+C")) copyToClipboard();
            ImGui::Separator();
            if (ImGui::MenuItem("quit", "Esc")) m_wantsToQuit = true;
            ImGui::EndMenu();
        }
        if (ImGui::BeginMenu("settings")) {
            ImGui::InputText("word list", m_pathBuf, sizeof(m_pathBuf));
            if (ImGui::Button("reload word list")) reloadWordList();
            ImGui::Separator();
            int order = m_cfg.order;
            if (ImGui::SliderInt("order", &order, 1, 6) && order != m_cfg.order) {
                m_cfg.order = order;
                rebuildModel();
            }
            ImGui::SliderInt("sections", &m_cfg.sections, 1, 8);
            if (ImGui::SliderInt("section length", &m_cfg.sectionLength, 3, 16)) {
                m_cfg.capitals = std::min(m_cfg.capitals, m_cfg.sectionLength);
                m_cfg.digits = std::min(m_cfg.digits, m_cfg.sectionLength - m_cfg.capitals);
            }
            ImGui::SliderInt("capitals", &m_cfg.capitals, 0, m_cfg.sectionLength - m_cfg.digits);
            ImGui::SliderInt("digits", &m_cfg.digits, 0, m_cfg.sectionLength - m_cfg.capitals);
            ImGui::InputText("delimiter", m_delimBuf, sizeof(m_delimBuf));
            ImGui::SliderInt("max attempts", &m_cfg.maxAttempts, 1, 100);
            ImGui::Separator();
            ImGui::Checkbox("secure randomness", &m_cfg.secureRandom);
            ImGui::Checkbox("copy on generate", &m_cfg.autoCopy);
            ImGui::EndMenu();
        }
        ImGui::EndMainMenuBar();
    }
}

void App::footer() {
    ImGui::TextDisabled("model:");
    ImGui::SameLine();
    if (m_model.isBuilt()) {
        ImGui::Text("%zu words, order %d, %zu prefixes",
            m_model.trainingSet().size(), m_model.order(), m_model.table().size());
    } else {
        ImGui::PushStyleColor(ImGuiCol_Text, colError);
        ImGui::Text("not built");
        ImGui::PopStyleColor();
    }
    if (!m_progressStage.empty()) {
        ImGui::ProgressBar(m_progress, ImVec2(-1, 0), m_progressStage.c_str());
    }

    ImGui::Separator();
    ImGui::BeginChild("log", ImVec2(0, 120.f), false);
    for (const auto& line : m_log) ImGui::TextDisabled("%s", line.c_str());
    if (ImGui::GetScrollY() >= ImGui::GetScrollMaxY()) ImGui::SetScrollHereY(1.0f);
    ImGui::EndChild();

    if (m_msgTimer > 0.f && !m_msg.empty()) {
        ImGui::Separator();
        ImGui::PushStyleColor(ImGuiCol_Text, m_msgIsError ? colError : colOk);
        ImGui::TextWrapped("%s", m_msg.c_str());
        ImGui::PopStyleColor();
    }
}

void App::renderUI() {
    ImGui::PushStyleColor(ImGuiCol_WindowBg, colBg);
    ImGui::Begin("##root", nullptr,
        ImGuiWindowFlags_NoDecoration |
        ImGuiWindowFlags_NoMove |
        ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_NoBringToFrontOnFocus);
    ImGui::SetWindowPos(ImVec2(0, 0));
    ImGui::SetWindowSize(ImGui::GetIO().DisplaySize);

    topMenu();
    ImGui::SetCursorPos(ImVec2(10, 26));
    ImGui::TextDisabled("randomness: %s  |  %d x %d chars",
        (m_cfg.secureRandom ? "system" : "mt19937_64"), m_cfg.sections, m_cfg.sectionLength);

    ImVec2 display = ImGui::GetIO().DisplaySize;
    float footerH = 240.f;
    float bottomMargin = 20.f;
    ImGui::SetCursorPos(ImVec2(0, 90.f));
    drawPassword();

    float footerW = std::min(760.f, display.x - 20.f);
    ImGui::SetCursorPos(ImVec2((display.x - footerW) * 0.5f, display.y - footerH - bottomMargin));
    ImGui::PushStyleColor(ImGuiCol_ChildBg, colPanel);
    ImGui::BeginChild("footer", ImVec2(footerW, footerH - 10.f), true);
    footer();
    ImGui::EndChild();
    ImGui::PopStyleColor();

    ImGui::End();
    ImGui::PopStyleColor();
}
