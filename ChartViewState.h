// SPDX-License-Identifier: GPL-3.0-or-later
// Copyright (C) 2026  Reikooters <https://github.com/Reikooters>

#ifndef RINGDU_CHARTVIEWSTATE_H
#define RINGDU_CHARTVIEWSTATE_H

#include <memory>
#include <string>
#include <vector>
#include "FileSystemEntry.h"
#include "chart/LayoutEngine.h"

/**
 * @brief Holds what the chart currently shows for one scan result.
 *
 * The tree itself is never modified. Focus, expansion and selection are kept
 * next to it, keyed by entry id, and reset whenever the focus moves so that a
 * drill-down always starts from the default depth.
 */
class ChartViewState {
public:
    explicit ChartViewState(LayoutEngine::LayoutOptions options = {});

    /**
     * @brief Replaces the tree being shown and resets focus, expansion and selection.
     * Passing null clears the view.
     */
    void setRoot(std::shared_ptr<const FileSystemEntry> root);

    [[nodiscard]] const FileSystemEntry* root() const { return m_root.get(); }

    /**
     * @brief The node at the center of the chart, or null if there is no tree.
     */
    [[nodiscard]] const FileSystemEntry* currentNode() const;

    /**
     * @brief Focuses a directory that has children. Expansion and selection are cleared.
     * @return false if the node cannot be focused.
     */
    bool drillDown(const FileSystemEntry& node);

    /**
     * @brief Returns focus to the previous node. The root is never popped.
     */
    bool goBack();
    [[nodiscard]] bool canGoBack() const { return m_navigation.size() > 1; }
    [[nodiscard]] const std::vector<const FileSystemEntry*>& navigationPath() const { return m_navigation; }

    /**
     * @brief Expands a collapsed node, or collapses an expanded one together with
     * everything expanded beneath it. Only directories with children can be toggled.
     * @return true if the node is expanded afterwards.
     */
    bool toggleExpansion(const FileSystemEntry& node);
    void expand(const FileSystemEntry& node);
    void collapse(const FileSystemEntry& node);
    [[nodiscard]] bool isExpanded(const FileSystemEntry& node) const { return m_expanded.contains(node.id); }
    [[nodiscard]] const LayoutEngine::ExpandedSet& expandedIds() const { return m_expanded; }

    void select(const FileSystemEntry* node) { m_selected = node; }
    [[nodiscard]] const FileSystemEntry* selected() const { return m_selected; }

    /**
     * @brief The node described by the info panel: the selection if any, else the focus.
     */
    [[nodiscard]] const FileSystemEntry* displayedNode() const;

    /**
     * @brief Current ring geometry. Recomputed on every call.
     */
    [[nodiscard]] std::vector<LayoutEngine::Ring> rings() const;

    /**
     * @brief Node under a canvas position, for a chart centered on a canvas of the
     * given size.
     */
    [[nodiscard]] const FileSystemEntry* nodeAt(double x, double y, double canvasWidth, double canvasHeight) const;

    [[nodiscard]] const FileSystemEntry* findByPath(const std::string& path) const;

    [[nodiscard]] const LayoutEngine::LayoutOptions& layoutOptions() const { return m_options; }
    void setLayoutOptions(const LayoutEngine::LayoutOptions& options) { m_options = options; }

private:
    void resetViewScope();

    LayoutEngine::LayoutOptions m_options;
    std::shared_ptr<const FileSystemEntry> m_root;
    std::vector<const FileSystemEntry*> m_navigation; // m_navigation.front() is the root
    LayoutEngine::ExpandedSet m_expanded;
    const FileSystemEntry* m_selected = nullptr;
};

#endif //RINGDU_CHARTVIEWSTATE_H
