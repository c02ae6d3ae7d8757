#ifndef XCONFIG_H
#define XCONFIG_H

// 默认约定
#define PDF2DOC_APP_NAME "pdf2doc"
#define PDF2DOC_WINDOW_TITLE "PDF to DOC converter"
#define PDF2DOC_TEMP_DIR_RELATIVE "PDF2DOC_TEMP"     // 配置目录，位于程序所在目录下
#define PDF2DOC_CONFIG_FILE_NAME "pdf2doc_config.ini" // 配置文件名

// 窗口
#define DEFAULT_WINDOW_X 0
#define DEFAULT_WINDOW_Y 0
#define DEFAULT_WINDOW_WIDTH 500
#define DEFAULT_WINDOW_HEIGHT 100
#define DEFAULT_FOOTER_POINT_SIZE 12 // 页脚字号

// 文件类型
#define PDF_SUFFIX ".pdf"
#define DOCX_SUFFIX ".docx"

// 配置键
#define SETTINGS_KEY_WINDOW_X "window_x"
#define SETTINGS_KEY_WINDOW_Y "window_y"
#define SETTINGS_KEY_WINDOW_WIDTH "window_width"
#define SETTINGS_KEY_WINDOW_HEIGHT "window_height"
#define SETTINGS_KEY_LAST_DIR "last_dir"

// 状态区文案
#define STATUS_NO_FILE "No file specified"
#define STATUS_INVALID_TYPE "Invalid file type"
#define STATUS_CONVERTING "Converting..."
#define STATUS_COMPLETE "Conversion complete!"
#define STATUS_FAILED "Conversion failed."
#define WARNING_TITLE "Conversion error"
#define WARNING_MESSAGE "Unable to convert file."
#define FOOTER_TEXT "Converts the text of each PDF page into a .docx paragraph"

#endif // XCONFIG_H
