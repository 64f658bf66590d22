#pragma once
#include <string>
#include <string_view>

namespace deploywrap {

	//---Нормализация имени целевого процесса:
	//	пробелы и кавычки по краям убираются, окончание ".exe" отбрасывается.
	//	Пустой результат означает "процесс не задан"
	std::string normalizeProcessName(std::string_view name);

	//---Совпадает ли имя образа процесса (с расширением или без, с путём или без)
	//	с нормализованным именем. Сравнение без учёта регистра
	bool matchesProcessName(std::string_view normalizedName, std::string_view imageName);

	//---Длина comm в /proc/<pid>/comm (TASK_COMM_LEN - 1)
	constexpr size_t kLinuxCommLength = 15;

	//---Сравнение с comm процесса Linux.
	//	Полное совпадение засчитывается всегда. Совпадение по первым 15 символам
	//	(ядро обрезает comm) только при allowTruncated: когда ни exe, ни argv[0]
	//	процесса прочитать не удалось
	bool matchesCommName(std::string_view normalizedName, std::string_view comm, bool allowTruncated);

};//---namespace deploywrap
