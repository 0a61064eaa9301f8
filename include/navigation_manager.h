#ifndef NAVIGATION_MANAGER_H
#define NAVIGATION_MANAGER_H

#include "gesture_types.h"

#include <optional>
#include <string>

/**
 * @brief Keyboard-level navigation commands
 */
enum class NavigationKey
{
    Next,
    Previous,
    First,
    Last,
    StartPageJump,
    ConfirmPageJump,
    CancelPageJump
};

/**
 * @brief Structure to hold navigation state
 */
struct NavigationState
{
    int currentPage = 1; // 1-based
    int pageCount = 0;   // 0 while the renderer has not reported a total

    // Page jump input state
    bool pageJumpInputActive = false;
    std::string pageJumpBuffer;
    TimestampMs pageJumpStartTime = 0;

    // Constants
    static constexpr Uint32 PAGE_JUMP_TIMEOUT = 5000; // 5 seconds
    static constexpr size_t PAGE_JUMP_MAX_DIGITS = 10;
};

/**
 * @brief Cached reader position, target clamping, page jump entry and reading progress
 *
 * The reader owns the real position; this is the controller's copy. It is updated
 * optimistically whenever an intent is emitted and overwritten whenever the reader
 * reports its position.
 */
class NavigationManager
{
public:
    NavigationManager();
    ~NavigationManager() = default;

    // State management
    void setPageCount(int pageCount);
    void setCurrentPage(int currentPage);

    // State accessors
    int getCurrentPage() const
    {
        return m_state.currentPage;
    }
    int getPageCount() const
    {
        return m_state.pageCount;
    }
    bool isPageCountKnown() const
    {
        return m_state.pageCount > 0;
    }
    bool isPageJumpInputActive() const
    {
        return m_state.pageJumpInputActive;
    }
    const std::string& getPageJumpBuffer() const
    {
        return m_state.pageJumpBuffer;
    }

    /**
     * @brief Clamp a page number into [1, pageCount], or [1, inf) while the count is unknown
     */
    int clampPage(int page) const;

    /**
     * @brief Target of a one-page step, or nullopt if the clamp leaves the page unchanged
     */
    std::optional<int> resolveStep(ScrollDirection direction) const;

    /**
     * @brief Clamped absolute target, or nullopt if it equals the current page
     */
    std::optional<int> resolveTarget(int page) const;

    bool canStep(ScrollDirection direction) const
    {
        return resolveStep(direction).has_value();
    }

    /**
     * @brief Record an emitted target as the current page
     */
    void commit(int page);

    // Page jump input handling
    void startPageJumpInput(TimestampMs now);
    bool handlePageJumpInput(char digit, TimestampMs now);
    void cancelPageJumpInput();

    /**
     * @brief Finish page jump entry
     * @return Clamped target page, or nullopt if the entry was empty, timed out or changes nothing
     */
    std::optional<int> confirmPageJumpInput(TimestampMs now);

    /**
     * @brief Cancel a page jump entry that has been idle past its timeout
     * @return true if the entry was cancelled
     */
    bool expirePageJumpInput(TimestampMs now);

    /**
     * @brief Percentage of the document read, 0 while the page count is unknown
     */
    int readingProgressPercent() const;

    // Utility methods
    void printNavigationState() const;

private:
    NavigationState m_state;

    bool isPageJumpTimedOut(TimestampMs now) const;
};

#endif // NAVIGATION_MANAGER_H
