// Copyright (c) 2025 Clarisma / GeoDesk contributors
// SPDX-License-Identifier: AGPL-3.0-only

#pragma once
#include <string>
#include <string_view>
#include <vector>

// The fixed texts of a report (headers, title, addresses, signatures).
// Every key has a default; a configuration file only needs to list the
// keys it changes.

class ReportSettings
{
public:
	ReportSettings();

	enum Key
	{
		HEADER_1,
		HEADER_2,
		TITLE,
		DATE_PREFIX,
		REFERENCE_NUMBER,
		DESCRIPTION,
		ADDRESS,
		POSTAL_CODE,
		CONTACT_PHONE,
		CONTACT_FAX,
		CONTACT_EMAIL,
		SIGN1,
		SIGN1_NAME,
		SIGN2,
		SIGN2_NAME,
		KEY_COUNT
	};

	static constexpr const char* FILE_NAME = "Report_config.json";

	static const char* keyName(Key key) { return KEY_NAMES[key]; }

	/// Returns the key with the given JSON name, or -1
	static int keyOf(std::string_view name);

	const std::string& get(Key key) const { return values_[key]; }
	void set(Key key, std::string_view value) { values_[key] = value; }

	const std::string& header1() const { return values_[HEADER_1]; }
	const std::string& header2() const { return values_[HEADER_2]; }
	const std::string& title() const { return values_[TITLE]; }
	const std::string& datePrefix() const { return values_[DATE_PREFIX]; }
	const std::string& referenceNumber() const { return values_[REFERENCE_NUMBER]; }
	const std::string& description() const { return values_[DESCRIPTION]; }
	const std::string& address() const { return values_[ADDRESS]; }
	const std::string& sign1() const { return values_[SIGN1]; }
	const std::string& sign1Name() const { return values_[SIGN1_NAME]; }
	const std::string& sign2() const { return values_[SIGN2]; }
	const std::string& sign2Name() const { return values_[SIGN2_NAME]; }

	/// The three lines printed at the foot of every page
	std::vector<std::string> footerLines() const;

	/// "address, date" as printed above the signatures
	std::string locationDate(std::string_view reportDate) const;

	/// Overrides the defaults with the keys found in a JSON object.
	/// Unknown keys are ignored. Throws IOException if the file cannot
	/// be read; the parser throws if it is not valid JSON.
	void load(const char* fileName);
	void loadFromString(const char* json);

private:
	std::string values_[KEY_COUNT];

	static const char* const KEY_NAMES[KEY_COUNT];
	static const char* const DEFAULTS[KEY_COUNT];
};
