/**
 * @file password_prompt.hpp
 * @brief Masked terminal password entry for the FolderVault CLI.
 */

#ifndef PASSWORD_PROMPT_HPP
#define PASSWORD_PROMPT_HPP

#include <optional>
#include <string>
#include "secret.hpp"
#include "vault.hpp"

/**
 * @brief Reads one line from the controlling terminal with echo disabled.
 *
 * Falls back to stdin/stderr when no terminal is attached.
 *
 * @param prompt Text shown before reading.
 * @return std::optional<Secret> The entered line without its newline, or std::nullopt on
 *         end of input or a terminal error.
 */
std::optional<Secret> readHiddenLine(const std::string& prompt);

/**
 * @brief Password hook backed by the terminal.
 *
 * Create asks twice and hands back an empty Secret when the two entries differ, so the
 * engine rejects it and asks again. Unlock asks once.
 */
PasswordRequest terminalPasswordPrompt();

#endif // PASSWORD_PROMPT_HPP
