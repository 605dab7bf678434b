// Lets the user choose which credential entry a connection should use.
#pragma once

#include "rdpvisor/UserInteraction.hpp"

#include <QDialog>
#include <QPointer>

#include <vector>

class QPushButton;
class QTableWidget;

class CredentialPickerDialog : public QDialog {
    Q_OBJECT
public:
    explicit CredentialPickerDialog(const std::vector<rdpvisor::PickerItem> &items,
                                    QWidget *parent = nullptr);

    // Entry id of the selected row, empty when none.
    std::string selectedEntryId() const;
    bool noneRequested() const { return noneRequested_; }

private slots:
    void updateButtons();
    void onNone();

private:
    void refresh();

    std::vector<rdpvisor::PickerItem> items_;
    QTableWidget *table_ = nullptr;
    QPushButton *btOk_ = nullptr;
    QPushButton *btNone_ = nullptr;
    bool noneRequested_ = false;
};

// CredentialPicker that shows CredentialPickerDialog modally.
class UiCredentialPicker : public rdpvisor::CredentialPicker {
public:
    explicit UiCredentialPicker(QWidget *owner = nullptr) : owner_(owner) {}

    rdpvisor::PickResult pick(const std::vector<rdpvisor::PickerItem> &items) override;

private:
    QPointer<QWidget> owner_;
};
