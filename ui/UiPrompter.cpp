#include "UiPrompter.hpp"
#include "UiAlerts.hpp"

#include <QString>
#include <QStringList>

namespace {
QMessageBox::Icon toIcon(rdpvisor::PromptIcon icon) {
    switch (icon) {
    case rdpvisor::PromptIcon::Information:
        return QMessageBox::Information;
    case rdpvisor::PromptIcon::Warning:
        return QMessageBox::Warning;
    case rdpvisor::PromptIcon::Error:
        return QMessageBox::Critical;
    case rdpvisor::PromptIcon::Question:
        return QMessageBox::Question;
    }
    return QMessageBox::NoIcon;
}
} // namespace

int UiPrompter::prompt(const rdpvisor::PromptRequest &req) {
    QStringList buttons;
    for (const std::string &b : req.buttons)
        buttons << QString::fromStdString(b);
    return UiAlerts::choose(owner_.data(), toIcon(req.icon),
                            QString::fromStdString(req.title),
                            QString::fromStdString(req.message),
                            QString::fromStdString(req.detail), buttons,
                            req.defaultIndex);
}
