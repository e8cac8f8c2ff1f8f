// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#include <algorithm>
#include "ChartViewState.h"
#include "chart/HitTester.h"

ChartViewState::ChartViewState(LayoutEngine::LayoutOptions options) : m_options(options) {}

void ChartViewState::setRoot(std::shared_ptr<const FileSystemEntry> root) {
    m_root = std::move(root);
    m_navigation.clear();
    if (m_root) {
        m_navigation.push_back(m_root.get());
    }
    resetViewScope();
}

const FileSystemEntry* ChartViewState::currentNode() const {
    return m_navigation.empty() ? nullptr : m_navigation.back();
}

bool ChartViewState::drillDown(const FileSystemEntry& node) {
    if (!m_root || !node.isDirectory || !node.hasChildren()) {
        return false;
    }
    if (&node == currentNode()) {
        return false;
    }

    m_navigation.push_back(&node);
    resetViewScope();
    return true;
}

bool ChartViewState::goBack() {
    if (!canGoBack()) {
        return false;
    }

    m_navigation.pop_back();
    resetViewScope();
    return true;
}

bool ChartViewState::toggleExpansion(const FileSystemEntry& node) {
    if (!node.isDirectory || !node.hasChildren()) {
        return false;
    }

    if (isExpanded(node)) {
        collapse(node);
        return false;
    }

    expand(node);
    return true;
}

void ChartViewState::expand(const FileSystemEntry& node) {
    if (node.hasChildren()) {
        m_expanded.insert(node.id);
    }
}

void ChartViewState::collapse(const FileSystemEntry& node) {
    LayoutEngine::collapse(m_expanded, node);
}

const FileSystemEntry* ChartViewState::displayedNode() const {
    return m_selected ? m_selected : currentNode();
}

std::vector<LayoutEngine::Ring> ChartViewState::rings() const {
    const FileSystemEntry* focus = currentNode();
    if (!focus) {
        return {};
    }
    return LayoutEngine::buildRings(*focus, m_expanded, m_options);
}

const FileSystemEntry* ChartViewState::nodeAt(double x, double y, double canvasWidth, double canvasHeight) const {
    const double chartRadius = std::min(canvasWidth, canvasHeight) / 2.0;
    const HitTester::PolarPoint point = HitTester::toPolar(x, y, canvasWidth / 2.0, canvasHeight / 2.0, chartRadius);
    return HitTester::locate(point, rings(), m_options);
}

const FileSystemEntry* ChartViewState::findByPath(const std::string& path) const {
    return m_root ? findEntryByPath(*m_root, path) : nullptr;
}

void ChartViewState::resetViewScope() {
    m_expanded.clear();
    m_selected = nullptr;
}
