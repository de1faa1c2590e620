#pragma once
#include <iosfwd>
#include <string>

namespace Voice {

// Speaks canonical phrases. A failed speak() is reported by the caller and
// never stops the session.
class Synthesizer {
public:
    virtual ~Synthesizer() = default;

    // Returns once the phrase has been rendered (or failed).
    virtual bool speak(const std::string& text, std::string* err = nullptr) = 0;

    virtual std::string name() const = 0;
};

// Writes each phrase as a line instead of speaking it (--dry-run).
class ConsoleSynthesizer : public Synthesizer {
public:
    explicit ConsoleSynthesizer(std::ostream& out);

    bool speak(const std::string& text, std::string* err = nullptr) override;
    std::string name() const override { return "console"; }

private:
    std::ostream& out_;
};

} // namespace Voice
