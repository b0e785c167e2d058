#pragma once

/*
 * C-интерфейс библиотеки YYID.
 */

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Генерирует новый токен в каноническом строковом виде.
 * @return Строка из 36 символов с завершающим нулем, которую нужно освободить через
 *         yyid_c_string_free(), либо NULL, если источник энтропии недоступен
 */
char *yyid_c_string(void);

/**
 * @brief Освобождает строку, полученную из yyid_c_string(). Допускается NULL.
 */
void yyid_c_string_free(char *str);

#ifdef __cplusplus
}
#endif
