#pragma once

#include <optional>
#include <string>

constexpr double kHourMs = 60.0 * 60.0 * 1000.0;
constexpr double kDayMs = 24.0 * kHourMs;
constexpr double kWeekMs = 7.0 * kDayMs;
constexpr int kDefaultDayStartHour = 4;

// Which calendar hour-of-day and day boundaries are read in
enum TimeBasis { BASIS_LOCAL, BASIS_UTC };

// Parses "YYYY-MM-DDTHH:MM:SS[.fff][Z|±HH:MM]" (a space may replace the 'T').
// A timestamp without offset is read as UTC. Returns nullopt for anything else.
std::optional<double> ParseIsoMs(const std::string &iso);

// Always "YYYY-MM-DDTHH:MM:SS.mmmZ", so stored values sort lexicographically.
std::string FormatIsoMs(double ms);

double FloorToHourMs(double ms);
int HourOfDay(double ms, TimeBasis basis);

int ShiftHourToDayStart(int hour, int dayStartHour = kDefaultDayStartHour);
int UnshiftHourFromDayStart(int shiftedHour, int dayStartHour = kDefaultDayStartHour);

// Start of the "day" containing referenceMs, where a day begins at dayStartHour
double LocalDayStartMs(double referenceMs, int dayStartHour, TimeBasis basis);

std::string DayKey(double ms, TimeBasis basis);   // 2026-10-19
std::string HourLabel(double ms, TimeBasis basis); // 09:00
std::string DateLabel(double ms, TimeBasis basis); // Oct 19

int ClampDays(int days);
int ClampWindowHours(int hours);
