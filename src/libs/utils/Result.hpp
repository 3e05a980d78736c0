// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QString>
#include <QStringList>

#include <utility>

namespace Utils {

struct Result {
	bool ok = true;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.ok = false;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		errors.push_back(msg);
	}

	void merge(const Result& other)
	{
		if (other.ok)
			return;
		ok = false;
		errors.append(other.errors);
	}

	// Single line suitable for a status bar or a log record.
	QString errorString(const QString& separator = QStringLiteral("; ")) const
	{
		return errors.join(separator);
	}

	explicit operator bool() const { return ok; }
};
} // namespace Utils
