// Prompter backed by modal message boxes.
#pragma once

#include "rdpvisor/UserInteraction.hpp"

#include <QPointer>
#include <QWidget>

class UiPrompter : public rdpvisor::Prompter {
public:
    explicit UiPrompter(QWidget *owner = nullptr) : owner_(owner) {}

    int prompt(const rdpvisor::PromptRequest &req) override;

private:
    QPointer<QWidget> owner_;
};
