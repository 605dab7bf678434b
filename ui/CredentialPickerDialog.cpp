// Table of candidate credential entries; double click or OK picks one.
#include "CredentialPickerDialog.hpp"

#include <QDialogButtonBox>
#include <QHeaderView>
#include <QPushButton>
#include <QTableWidget>
#include <QVBoxLayout>

CredentialPickerDialog::CredentialPickerDialog(
    const std::vector<rdpvisor::PickerItem> &items, QWidget *parent)
    : QDialog(parent), items_(items) {
    setWindowTitle(tr("Select credentials"));
    resize(640, 400);
    auto *lay = new QVBoxLayout(this);
    table_ = new QTableWidget(this);
    table_->setColumnCount(3);
    table_->setHorizontalHeaderLabels({tr("Title"), tr("Username"), tr("Group")});
    table_->verticalHeader()->setVisible(false);
    table_->horizontalHeader()->setStretchLastSection(false);
    table_->horizontalHeader()->setSectionResizeMode(0, QHeaderView::Stretch);
    table_->horizontalHeader()->setSectionResizeMode(1, QHeaderView::ResizeToContents);
    table_->horizontalHeader()->setSectionResizeMode(2, QHeaderView::ResizeToContents);
    table_->setSelectionBehavior(QAbstractItemView::SelectRows);
    table_->setSelectionMode(QAbstractItemView::SingleSelection);
    table_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    table_->setSortingEnabled(true);
    lay->addWidget(table_);

    auto *bb = new QDialogButtonBox(this);
    btOk_ = bb->addButton(QDialogButtonBox::Ok);
    btNone_ = bb->addButton(tr("Without credentials"), QDialogButtonBox::ActionRole);
    bb->addButton(QDialogButtonBox::Cancel);
    lay->addWidget(bb);
    connect(bb, &QDialogButtonBox::accepted, this, &QDialog::accept);
    connect(bb, &QDialogButtonBox::rejected, this, &QDialog::reject);
    connect(btNone_, &QPushButton::clicked, this, &CredentialPickerDialog::onNone);
    connect(table_, &QTableWidget::cellDoubleClicked, this, [this](int, int) {
        if (!selectedEntryId().empty())
            accept();
    });

    refresh();
    if (table_->rowCount() > 0)
        table_->selectRow(0);
    updateButtons();
    connect(table_->selectionModel(), &QItemSelectionModel::selectionChanged,
            this, &CredentialPickerDialog::updateButtons);
}

void CredentialPickerDialog::refresh() {
    // Avoid re-sorting while filling
    const bool wasSorting = table_->isSortingEnabled();
    if (wasSorting)
        table_->setSortingEnabled(false);
    table_->setRowCount(static_cast<int>(items_.size()));
    for (int i = 0; i < static_cast<int>(items_.size()); ++i) {
        const auto &it = items_[static_cast<std::size_t>(i)];
        auto *itTitle = new QTableWidgetItem(QString::fromStdString(it.title));
        auto *itUser = new QTableWidgetItem(QString::fromStdString(it.username));
        auto *itGroup = new QTableWidgetItem(QString::fromStdString(it.groupName));
        // Original index survives sorting
        itTitle->setData(Qt::UserRole, i);
        itUser->setData(Qt::UserRole, i);
        itGroup->setData(Qt::UserRole, i);
        table_->setItem(i, 0, itTitle);
        table_->setItem(i, 1, itUser);
        table_->setItem(i, 2, itGroup);
    }
    if (wasSorting)
        table_->setSortingEnabled(true);
}

std::string CredentialPickerDialog::selectedEntryId() const {
    const auto rows = table_->selectionModel()->selectedRows();
    if (rows.isEmpty())
        return std::string();
    const QTableWidgetItem *item = table_->item(rows.first().row(), 0);
    if (!item)
        return std::string();
    const int idx = item->data(Qt::UserRole).toInt();
    if (idx < 0 || idx >= static_cast<int>(items_.size()))
        return std::string();
    return items_[static_cast<std::size_t>(idx)].entryId;
}

void CredentialPickerDialog::updateButtons() {
    btOk_->setEnabled(!selectedEntryId().empty());
}

void CredentialPickerDialog::onNone() {
    noneRequested_ = true;
    accept();
}

rdpvisor::PickResult
UiCredentialPicker::pick(const std::vector<rdpvisor::PickerItem> &items) {
    rdpvisor::PickResult r;
    CredentialPickerDialog dlg(items, owner_.data());
    if (dlg.exec() != QDialog::Accepted) {
        r.status = rdpvisor::PickResult::Status::Cancelled;
        return r;
    }
    if (dlg.noneRequested()) {
        r.status = rdpvisor::PickResult::Status::None;
        return r;
    }
    r.entryId = dlg.selectedEntryId();
    r.status = r.entryId.empty() ? rdpvisor::PickResult::Status::None
                                 : rdpvisor::PickResult::Status::Chosen;
    return r;
}
