#include "TypingTitle.hpp"

void TypingTitle::update(float dt) {
    m_timer += dt;
    // a negative timer is a hold; no step until it climbs back to kStep
    while (m_timer >= kStep) {
        m_timer -= kStep;
        if (!m_backspacing) {
            if (m_charIndex < (int)m_text.length()) m_charIndex++;
            if (m_charIndex >= (int)m_text.length()) {
                m_backspacing = true;
                m_timer = -kHoldFull;
            }
        } else {
            if (m_charIndex > 0) m_charIndex--;
            if (m_charIndex <= 0) {
                m_backspacing = false;
                m_timer = -kHoldEmpty;
            }
        }
    }
}

std::string TypingTitle::visible() const {
    std::string s = m_text.substr(0, (size_t)m_charIndex);
    if (!m_backspacing && m_charIndex < (int)m_text.length()) s += "|";
    return s;
}
