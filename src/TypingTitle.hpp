#pragma once
#include <string>

// Title that types itself out, holds, backspaces, pauses and repeats.
class TypingTitle {
public:
    explicit TypingTitle(std::string text) : m_text(std::move(text)) {}

    void update(float dt);

    // visible prefix, with a cursor while typing forward
    std::string visible() const;
    const std::string& text() const { return m_text; }
    int charIndex() const { return m_charIndex; }
    bool backspacing() const { return m_backspacing; }

    static constexpr float kStep = 0.15f;
    static constexpr float kHoldFull = 1.5f;
    static constexpr float kHoldEmpty = 0.3f;

private:
    std::string m_text;
    float m_timer = 0.f;
    int m_charIndex = 0;
    bool m_backspacing = false;
};
