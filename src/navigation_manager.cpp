#include "navigation_manager.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <iostream>
#include <string>

NavigationManager::NavigationManager()
{
    // Default state is already initialized in NavigationState
}

void NavigationManager::setPageCount(int pageCount)
{
    m_state.pageCount = std::max(0, pageCount);

    // The renderer may report the true bound after optimistic forward turns
    m_state.currentPage = clampPage(m_state.currentPage);
}

void NavigationManager::setCurrentPage(int currentPage)
{
    m_state.currentPage = clampPage(currentPage);
}

int NavigationManager::clampPage(int page) const
{
    if (m_state.pageCount > 0)
    {
        return std::clamp(page, 1, m_state.pageCount);
    }
    return std::max(1, page);
}

std::optional<int> NavigationManager::resolveStep(ScrollDirection direction) const
{
    switch (direction)
    {
    case ScrollDirection::Forward:
        if (m_state.currentPage == INT_MAX)
            return std::nullopt;
        return resolveTarget(m_state.currentPage + 1);
    case ScrollDirection::Backward:
        return resolveTarget(m_state.currentPage - 1);
    case ScrollDirection::None:
        break;
    }
    return std::nullopt;
}

std::optional<int> NavigationManager::resolveTarget(int page) const
{
    int target = clampPage(page);
    if (target == m_state.currentPage)
    {
        return std::nullopt;
    }
    return target;
}

void NavigationManager::commit(int page)
{
    m_state.currentPage = clampPage(page);
}

void NavigationManager::startPageJumpInput(TimestampMs now)
{
    m_state.pageJumpInputActive = true;
    m_state.pageJumpBuffer.clear();
    m_state.pageJumpStartTime = now;
    if (isPageCountKnown())
    {
        std::cout << "Page jump mode activated. Enter page number (1-" << m_state.pageCount << ") and press Enter." << std::endl;
    }
    else
    {
        std::cout << "Page jump mode activated. Enter page number and press Enter." << std::endl;
    }
}

bool NavigationManager::isPageJumpTimedOut(TimestampMs now) const
{
    return now > m_state.pageJumpStartTime && (now - m_state.pageJumpStartTime) > NavigationState::PAGE_JUMP_TIMEOUT;
}

bool NavigationManager::handlePageJumpInput(char digit, TimestampMs now)
{
    if (!m_state.pageJumpInputActive)
        return false;

    if (isPageJumpTimedOut(now))
    {
        cancelPageJumpInput();
        return false;
    }

    if (digit < '0' || digit > '9')
        return false;

    // Limit input length to prevent overflow
    if (m_state.pageJumpBuffer.length() >= NavigationState::PAGE_JUMP_MAX_DIGITS)
        return false;

    m_state.pageJumpBuffer += digit;
    std::cout << "Page jump input: " << m_state.pageJumpBuffer << std::endl;
    return true;
}

void NavigationManager::cancelPageJumpInput()
{
    if (m_state.pageJumpInputActive)
    {
        m_state.pageJumpInputActive = false;
        m_state.pageJumpBuffer.clear();
        std::cout << "Page jump cancelled." << std::endl;
    }
}

bool NavigationManager::expirePageJumpInput(TimestampMs now)
{
    if (m_state.pageJumpInputActive && isPageJumpTimedOut(now))
    {
        cancelPageJumpInput();
        return true;
    }
    return false;
}

std::optional<int> NavigationManager::confirmPageJumpInput(TimestampMs now)
{
    if (!m_state.pageJumpInputActive)
        return std::nullopt;

    if (m_state.pageJumpBuffer.empty() || isPageJumpTimedOut(now))
    {
        cancelPageJumpInput();
        return std::nullopt;
    }

    std::optional<int> target;
    try
    {
        long long requested = std::stoll(m_state.pageJumpBuffer);
        requested = std::clamp<long long>(requested, INT_MIN, INT_MAX);
        target = resolveTarget(static_cast<int>(requested));
        if (target)
        {
            std::cout << "Jumped to page " << *target << std::endl;
        }
        else
        {
            std::cout << "Page jump to " << m_state.pageJumpBuffer << " leaves page " << m_state.currentPage << " unchanged" << std::endl;
        }
    }
    catch (const std::exception& e)
    {
        std::cout << "Invalid page number format: " << m_state.pageJumpBuffer << " (" << e.what() << ")" << std::endl;
    }

    m_state.pageJumpInputActive = false;
    m_state.pageJumpBuffer.clear();
    return target;
}

int NavigationManager::readingProgressPercent() const
{
    if (m_state.pageCount <= 0)
        return 0;
    return static_cast<int>(std::lround(static_cast<double>(m_state.currentPage) / m_state.pageCount * 100.0));
}

void NavigationManager::printNavigationState() const
{
    std::cout << "--- Navigation State ---" << std::endl;
    if (isPageCountKnown())
    {
        std::cout << "Current Page: " << m_state.currentPage << "/" << m_state.pageCount << std::endl;
    }
    else
    {
        std::cout << "Current Page: " << m_state.currentPage << "/?" << std::endl;
    }
    std::cout << "Reading Progress: " << readingProgressPercent() << "%" << std::endl;
    std::cout << "Page Jump Active: " << (m_state.pageJumpInputActive ? "Yes" : "No") << std::endl;
    if (m_state.pageJumpInputActive)
    {
        std::cout << "Page Jump Buffer: '" << m_state.pageJumpBuffer << "'" << std::endl;
    }
    std::cout << "------------------------" << std::endl;
}
