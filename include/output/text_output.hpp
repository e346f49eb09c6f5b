#ifndef TEXT_OUTPUT_HPP
#define TEXT_OUTPUT_HPP

#include <string>

// Receives finished transcripts (the auto-type / clipboard collaborator).
class TextOutput {
public:
    virtual ~TextOutput() = default;

    // pressEnter: follow the text with a newline keystroke.
    virtual void deliver(const std::string& text, bool pressEnter) = 0;
};

// Pipes the text into an external typing tool (xdotool, wtype, ydotool ...)
// and runs a second command for the newline.
class CommandTextOutput : public TextOutput {
public:
    CommandTextOutput(std::string typeCommand, std::string enterCommand);

    void deliver(const std::string& text, bool pressEnter) override;

private:
    std::string typeCommand_;
    std::string enterCommand_;
};

#endif
