#include "gui/MatchTableModel.h"

#include <QString>

#include <algorithm>
#include <limits>

MatchTableModel::MatchTableModel(QObject *parent) : QAbstractTableModel(parent) {}

int MatchTableModel::rowCount(const QModelIndex &parent) const {
    if (parent.isValid()) return 0;
    return clampedRows(matches_.size());
}

int MatchTableModel::clampedRows(size_t count) {
    return static_cast<int>(std::min<size_t>(count, static_cast<size_t>(std::numeric_limits<int>::max())));
}

int MatchTableModel::columnCount(const QModelIndex &parent) const {
    Q_UNUSED(parent);
    return 5;
}

QVariant MatchTableModel::data(const QModelIndex &index, int role) const {
    if (!index.isValid() || index.row() < 0 || index.row() >= rowCount()) return {};
    const auto &m = matches_[index.row()];
    if (role == Qt::TextAlignmentRole && index.column() <= 2) {
        return static_cast<int>(Qt::AlignRight | Qt::AlignVCenter);
    }
    if (role != Qt::DisplayRole) return {};
    switch (index.column()) {
        case 0: return QString::fromStdString(xorhunt::formatKey(m.key, keyWidth_));
        case 1: return QString::asprintf("0x%llX", static_cast<unsigned long long>(m.offset));
        case 2: return QString::number(static_cast<qulonglong>(m.offset));
        case 3: return QString::fromStdString(m.signature);
        case 4: return QString::fromLatin1(xorhunt::endiannessName(m.endianness));
    }
    return {};
}

QVariant MatchTableModel::headerData(int section, Qt::Orientation orientation, int role) const {
    if (orientation == Qt::Horizontal && role == Qt::DisplayRole) {
        switch (section) {
            case 0: return "Key";
            case 1: return "Offset";
            case 2: return "Offset (dec)";
            case 3: return "Filesystem";
            case 4: return "Endianness";
        }
    }
    return {};
}

void MatchTableModel::setMatches(std::vector<xorhunt::Match> matches, unsigned keyWidth) {
    beginResetModel();
    matches_ = std::move(matches);
    keyWidth_ = keyWidth;
    endResetModel();
}

void MatchTableModel::clear() {
    beginResetModel();
    matches_.clear();
    endResetModel();
}

const xorhunt::Match *MatchTableModel::matchAt(int row) const {
    if (row < 0 || row >= rowCount()) return nullptr;
    return &matches_[row];
}
