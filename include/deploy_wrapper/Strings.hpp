#pragma once
#include <cctype>
#include <string>
#include <string_view>

namespace deploywrap {

	//---Удаление пробельных символов в начале и конце строки
	inline std::string_view trimView(std::string_view sv) noexcept
	{
		while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
		while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
		return sv;
	}

	//---Удаление кавычек в начале и конце строки (если они есть)
	inline std::string_view trimQuotesView(std::string_view sv) noexcept
	{
		if (sv.size() < 2) return sv;

		const bool doubleQuoted = (sv.front() == '"' && sv.back() == '"');
		const bool singleQuoted = (sv.front() == '\'' && sv.back() == '\'');

		if (doubleQuoted || singleQuoted)
		{
			sv.remove_prefix(1);
			sv.remove_suffix(1);
		}
		return sv;
	}

	//---Сравнение без учёта регистра (ASCII)
	inline bool iequals(std::string_view a, std::string_view b) noexcept
	{
		if (a.size() != b.size()) return false;
		for (size_t i = 0; i < a.size(); i++)
		{
			char x = a[i], y = b[i];
			if (x >= 'A' && x <= 'Z') x = char(x - 'A' + 'a');
			if (y >= 'A' && y <= 'Z') y = char(y - 'A' + 'a');
			if (x != y) return false;
		}
		return true;
	}

	//---Проверка окончания строки без учёта регистра
	inline bool iendsWith(std::string_view s, std::string_view suffix) noexcept
	{
		return s.size() >= suffix.size() && iequals(s.substr(s.size() - suffix.size()), suffix);
	}

};//---namespace deploywrap
